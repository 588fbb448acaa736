#include <algorithm>
#include <tranche/execution/authorization.hpp>
#include <tuple>

namespace tranche::execution {

namespace {

bool assignment_less(const tranche::schema::role_assignment_t& lhs,
                     const tranche::schema::role_assignment_t& rhs) {
  return std::tie(lhs.subject, lhs.role) < std::tie(rhs.subject, rhs.role);
}

}  // namespace

role_book::role_book(std::vector<tranche::schema::role_assignment_t>& roles)
    : roles_{roles} {}

bool role_book::has_role(const tranche::schema::account_id_t& subject,
                         const tranche::schema::role_id_t role) const {
  auto probe = tranche::schema::role_assignment_t{.subject = subject,
                                                  .role = role};
  return std::binary_search(std::begin(roles_), std::end(roles_), probe,
                            assignment_less);
}

bool role_book::is_authorized(const tranche::schema::account_id_t& caller,
                              const tranche::schema::role_id_t role) const {
  return has_role(caller, role) ||
         has_role(caller, tranche::schema::role_id_t::admin);
}

void role_book::assign(const tranche::schema::account_id_t& subject,
                       const tranche::schema::role_id_t role,
                       const bool enabled) {
  auto probe = tranche::schema::role_assignment_t{.subject = subject,
                                                  .role = role};
  auto it = std::lower_bound(std::begin(roles_), std::end(roles_), probe,
                             assignment_less);
  auto present = it != std::end(roles_) && !assignment_less(probe, *it);
  if (enabled && !present) {
    roles_.insert(it, probe);
  } else if (!enabled && present) {
    roles_.erase(it);
  }
}

}  // namespace tranche::execution
