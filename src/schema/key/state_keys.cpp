#include <leasehold/schema/key/builder.hpp>
#include <leasehold/schema/key/state_keys.hpp>

#include <algorithm>
#include <iterator>

namespace leasehold::schema::key {

bytes_t make_key(std::string_view prefix) {
  return builder{}.write(prefix).data;
}

bytes_t make_entity_key(std::string_view prefix, entity_id_t entity_id) {
  return builder{}.write(prefix).write(entity_id).data;
}

bytes_t make_entity_address_key(std::string_view prefix,
                                entity_id_t entity_id,
                                const address_t& address) {
  return builder{}.write(prefix).write(entity_id).write(address).data;
}

bytes_t make_plugin_key(policy_type_t type) {
  return builder{}
      .write(kApprovedPluginPrefix)
      .write(static_cast<uint8_t>(type))
      .data;
}

bytes_t make_request_nonce_key(const address_t& signer) {
  return builder{}.write(kRequestNoncePrefix).write(signer).data;
}

bytes_t make_event_key(uint64_t event_id) {
  return builder{}.write(kEventPrefix).write(event_id).data;
}

std::optional<address_t> address_from_key(const bytes_view_t& key) {
  auto address = address_t{};
  if (key.size() < address.size()) {
    return std::nullopt;
  }
  std::copy(std::end(key) - static_cast<std::ptrdiff_t>(address.size()),
            std::end(key), std::begin(address));
  return address;
}

}  // namespace leasehold::schema::key
