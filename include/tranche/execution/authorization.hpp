#pragma once

#include <tranche/schema/primitives.hpp>
#include <tranche/schema/role_assignment.hpp>
#include <tranche/schema/role_id.hpp>

#include <vector>

namespace tranche::execution {

/// Coarse role check consulted by every privileged entry point.
class authorization {
 public:
  virtual ~authorization() = default;

  virtual bool is_authorized(const tranche::schema::account_id_t& caller,
                             tranche::schema::role_id_t role) const = 0;
};

/// Role assignments held in ledger state. An admin satisfies every role.
class role_book final : public authorization {
 public:
  explicit role_book(std::vector<tranche::schema::role_assignment_t>& roles);

  bool is_authorized(const tranche::schema::account_id_t& caller,
                     tranche::schema::role_id_t role) const override;

  /// Grant or revoke. Assignments are kept sorted by (subject, role).
  void assign(const tranche::schema::account_id_t& subject,
              tranche::schema::role_id_t role,
              bool enabled);

  bool has_role(const tranche::schema::account_id_t& subject,
                tranche::schema::role_id_t role) const;

 private:
  std::vector<tranche::schema::role_assignment_t>& roles_;
};

}  // namespace tranche::execution
