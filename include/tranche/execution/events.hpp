#pragma once

#include <tranche/schema/primitives.hpp>
#include <tranche/schema/transaction_event.hpp>

#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tranche::execution {

using event_attribute_t = std::pair<std::string_view, std::string>;

/// Build an event; the first attribute is indexed.
tranche::schema::transaction_event_t make_event(
    std::string_view type,
    std::initializer_list<event_attribute_t> attributes);

void emit(std::vector<tranche::schema::transaction_event_t>& events,
          std::string_view type,
          std::initializer_list<event_attribute_t> attributes);

std::string to_attribute(const tranche::schema::hash32_t& value);
std::string to_attribute(const tranche::schema::amount_t& value);
std::string to_attribute(uint64_t value);

}  // namespace tranche::execution
