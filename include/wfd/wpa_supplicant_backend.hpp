/**
 * @file wpa_supplicant_backend.hpp
 * @brief P2pBackend over the wpa_supplicant D-Bus API (sd-bus).
 *
 * Object model:
 *   fi.w1.wpa_supplicant1 @ /fi/w1/wpa_supplicant1
 *     GetInterface(s ifname) -> o
 *   fi.w1.wpa_supplicant1.Interface.P2PDevice @ <interface path>
 *     Find(a{sv})       p2p_find
 *     StopFind()        p2p_stop_find
 *     Connect(a{sv})    p2p_connect   {peer, wps_method="pbc"}
 *     GroupAdd(a{sv})   p2p_group_add
 *
 * All calls are synchronous on the caller's thread. The bus connection is
 * not thread-safe; the manager actor is the only caller after Create().
 *
 * Linux only. Link with libsystemd.
 */

#ifndef WFD_WPA_SUPPLICANT_BACKEND_HPP_
#define WFD_WPA_SUPPLICANT_BACKEND_HPP_

#include "wfd/backend.hpp"
#include "wfd/device.hpp"
#include "wfd/error.hpp"
#include "wfd/log.hpp"
#include "wfd/vocabulary.hpp"

#include <systemd/sd-bus.h>

#include <cstdint>
#include <cstring>
#include <memory>

namespace wfd {

static constexpr const char* kWpaSupplicantService = "fi.w1.wpa_supplicant1";
static constexpr const char* kWpaSupplicantPath = "/fi/w1/wpa_supplicant1";
static constexpr const char* kWpaSupplicantInterface = "fi.w1.wpa_supplicant1";
static constexpr const char* kWpaSupplicantP2pInterface =
    "fi.w1.wpa_supplicant1.Interface.P2PDevice";

static constexpr uint32_t kObjectPathMaxLen = 127U;
using ObjectPath = FixedString<kObjectPathMaxLen>;

namespace detail {

/// Owns an sd_bus_error for the duration of one call.
struct BusErrorGuard {
  sd_bus_error err{};
  ~BusErrorGuard() { sd_bus_error_free(&err); }
};

/// Owns one message reference.
struct MessageGuard {
  sd_bus_message* msg = nullptr;
  ~MessageGuard() { (void)sd_bus_message_unref(msg); }
};

struct StringOption {
  const char* key;
  const char* signature;  ///< "s" or "o"
  const char* value;
};

/// Append an a{sv} dictionary of string-typed values.
inline int AppendOptions(sd_bus_message* msg, const StringOption* options,
                         uint32_t count) {
  int r = sd_bus_message_open_container(msg, SD_BUS_TYPE_ARRAY, "{sv}");
  if (r < 0) return r;
  for (uint32_t i = 0; i < count; ++i) {
    r = sd_bus_message_open_container(msg, SD_BUS_TYPE_DICT_ENTRY, "sv");
    if (r < 0) return r;
    r = sd_bus_message_append(msg, "s", options[i].key);
    if (r < 0) return r;
    r = sd_bus_message_append(msg, "v", options[i].signature, options[i].value);
    if (r < 0) return r;
    r = sd_bus_message_close_container(msg);  // dict entry
    if (r < 0) return r;
  }
  return sd_bus_message_close_container(msg);  // a{sv}
}

inline P2pError CallError(const char* method, const BusErrorGuard& guard, int r) {
  if (sd_bus_error_is_set(&guard.err)) {
    return P2pError::Format(P2pErrorKind::kRemoteCallFailure, "%s: %s: %s", method,
                            guard.err.name,
                            guard.err.message != nullptr ? guard.err.message : "");
  }
  return P2pError::Format(P2pErrorKind::kRemoteCallFailure, "%s: %s", method,
                          std::strerror(-r));
}

}  // namespace detail

// ============================================================================
// WpaSupplicantBackend
// ============================================================================

class WpaSupplicantBackend final : public P2pBackend {
 public:
  using CreateResult = expected<std::unique_ptr<WpaSupplicantBackend>, P2pError>;

  /**
   * @brief Connect to the system bus and resolve @p interface_name.
   *
   * Fails with kInvalidInput for a bad name, kRemoteCallFailure when the
   * bus or wpa_supplicant is unreachable or does not manage the interface,
   * kSerializationFailure for a malformed reply.
   */
  static CreateResult Create(const char* interface_name) {
    auto name = ValidateInterfaceName(interface_name);
    if (!name.has_value()) return CreateResult::error(name.get_error());

    sd_bus* bus = nullptr;
    int r = sd_bus_open_system(&bus);
    if (r < 0) {
      WFD_LOG_ERROR("WpaBackend", "system bus unavailable: %s", std::strerror(-r));
      return CreateResult::error(P2pError::Format(
          P2pErrorKind::kRemoteCallFailure, "open system bus: %s", std::strerror(-r)));
    }
    return Attach(bus, name.value());
  }

  ~WpaSupplicantBackend() override { (void)sd_bus_flush_close_unref(bus_); }

  WpaSupplicantBackend(const WpaSupplicantBackend&) = delete;
  WpaSupplicantBackend& operator=(const WpaSupplicantBackend&) = delete;

  ActionResult DiscoverPeers() override { return CallP2p("Find", nullptr, 0U); }

  ActionResult StopDiscovery() override {
    detail::BusErrorGuard guard;
    detail::MessageGuard reply;
    int r = sd_bus_call_method(bus_, kWpaSupplicantService, interface_path_.c_str(),
                               kWpaSupplicantP2pInterface, "StopFind", &guard.err,
                               &reply.msg, "");
    if (r < 0) return ActionResult::error(detail::CallError("StopFind", guard, r));
    return ActionResult::success();
  }

  /// Push-button connect. Object-path peers are sent as "o", addresses as "s".
  ActionResult Connect(const PeerAddress& device_address) override {
    const detail::StringOption options[] = {
        {"peer", device_address.c_str()[0] == '/' ? "o" : "s", device_address.c_str()},
        {"wps_method", "s", "pbc"},
    };
    return CallP2p("Connect", options, 2U);
  }

  ActionResult CreateGroup() override { return CallP2p("GroupAdd", nullptr, 0U); }

  /** @brief Raw connection for signal subscriptions or extra interfaces. */
  sd_bus* Bus() const noexcept { return bus_; }

  /** @brief Resolved interface object, e.g. /fi/w1/wpa_supplicant1/Interfaces/0. */
  const char* InterfacePath() const noexcept { return interface_path_.c_str(); }

  const InterfaceName& GetInterfaceName() const noexcept { return interface_name_; }

 private:
  WpaSupplicantBackend(sd_bus* bus, const InterfaceName& name, const char* path) noexcept
      : bus_(bus), interface_name_(name), interface_path_(TruncateToCapacity, path) {}

  /// Takes ownership of @p bus on every path.
  static CreateResult Attach(sd_bus* bus, const InterfaceName& name) {
    detail::BusErrorGuard guard;
    detail::MessageGuard reply;
    int r = sd_bus_call_method(bus, kWpaSupplicantService, kWpaSupplicantPath,
                               kWpaSupplicantInterface, "GetInterface", &guard.err,
                               &reply.msg, "s", name.c_str());
    if (r < 0) {
      P2pError e = detail::CallError("GetInterface", guard, r);
      WFD_LOG_ERROR("WpaBackend", "cannot resolve %s: %s", name.c_str(), e.What());
      (void)sd_bus_flush_close_unref(bus);
      return CreateResult::error(e);
    }

    const char* path = nullptr;
    r = sd_bus_message_read(reply.msg, "o", &path);
    if (r < 0 || path == nullptr || std::strlen(path) > kObjectPathMaxLen) {
      (void)sd_bus_flush_close_unref(bus);
      return CreateResult::error(P2pError::Format(
          P2pErrorKind::kSerializationFailure, "GetInterface reply: %s",
          r < 0 ? std::strerror(-r) : "bad object path"));
    }

    WFD_LOG_INFO("WpaBackend", "%s -> %s", name.c_str(), path);
    return CreateResult::success(
        std::unique_ptr<WpaSupplicantBackend>(new WpaSupplicantBackend(bus, name, path)));
  }

  /// Call a P2PDevice method taking a single a{sv} argument.
  ActionResult CallP2p(const char* method, const detail::StringOption* options,
                       uint32_t count) {
    detail::MessageGuard call;
    int r = sd_bus_message_new_method_call(bus_, &call.msg, kWpaSupplicantService,
                                           interface_path_.c_str(),
                                           kWpaSupplicantP2pInterface, method);
    if (r >= 0) r = detail::AppendOptions(call.msg, options, count);
    if (r < 0) {
      return ActionResult::error(P2pError::Format(
          P2pErrorKind::kSerializationFailure, "%s arguments: %s", method,
          std::strerror(-r)));
    }

    detail::BusErrorGuard guard;
    detail::MessageGuard reply;
    r = sd_bus_call(bus_, call.msg, 0, &guard.err, &reply.msg);
    if (r < 0) return ActionResult::error(detail::CallError(method, guard, r));
    return ActionResult::success();
  }

  sd_bus* bus_;
  InterfaceName interface_name_;
  ObjectPath interface_path_;
};

}  // namespace wfd

#endif  // WFD_WPA_SUPPLICANT_BACKEND_HPP_
