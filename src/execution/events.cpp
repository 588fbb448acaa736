#include <tranche/execution/events.hpp>

namespace tranche::execution {

tranche::schema::transaction_event_t make_event(
    const std::string_view type,
    std::initializer_list<event_attribute_t> attributes) {
  auto event = tranche::schema::transaction_event_t{};
  event.type = std::string{type};
  event.attributes.reserve(attributes.size());
  auto first = true;
  for (const auto& [key, value] : attributes) {
    event.attributes.push_back(tranche::schema::transaction_event_attribute_t{
        .key = std::string{key}, .value = value, .index = first});
    first = false;
  }
  return event;
}

void emit(std::vector<tranche::schema::transaction_event_t>& events,
          const std::string_view type,
          std::initializer_list<event_attribute_t> attributes) {
  events.push_back(make_event(type, attributes));
}

std::string to_attribute(const tranche::schema::hash32_t& value) {
  return tranche::schema::to_hex(tranche::schema::bytes_view_t{value});
}

std::string to_attribute(const tranche::schema::amount_t& value) {
  return value.str();
}

std::string to_attribute(const uint64_t value) {
  return std::to_string(value);
}

}  // namespace tranche::execution
