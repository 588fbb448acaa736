#pragma once

#include <tranche/schema/primitives.hpp>
#include <functional>

namespace tranche::execution {

using signature_verifier_t =
    std::function<bool(const tranche::schema::bytes_view_t& message,
                       const tranche::schema::signer_id_t& signer,
                       const tranche::schema::signature_t& signature)>;

}  // namespace tranche::execution
