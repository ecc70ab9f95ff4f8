#include <leasehold/policy/policy_plugin.hpp>

namespace leasehold::policy {

void policy_plugin::commit(const check_context_t&) {}

void policy_plugin::initialize_instance(leasehold::schema::entity_id_t,
                                        leasehold::schema::entity_id_t) {}

}  // namespace leasehold::policy
