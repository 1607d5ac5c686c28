#include <dwn/core/parse.hpp>
#include <dwn/schema/protocol_definition.hpp>
#include <dwn/schema/url.hpp>

#include <algorithm>
#include <set>

namespace dwn::core {

namespace {

bool check_url(const std::optional<std::string>& url,
               const std::string_view field,
               std::string& error) {
  if (url && !dwn::schema::is_normalized_url(*url)) {
    error = std::string{field} + " '" + *url + "' is not a normalized URL";
    return false;
  }
  return true;
}

bool check_record_id(const std::string& record_id, std::string& error) {
  if (record_id.empty()) {
    error = "recordId is missing";
    return false;
  }
  return true;
}

std::vector<std::string> split_path(const std::string_view path) {
  auto segments = std::vector<std::string>{};
  auto begin = std::size_t{0};
  while (begin <= path.size()) {
    auto end = path.find('/', begin);
    if (end == std::string_view::npos) {
      end = path.size();
    }
    segments.emplace_back(path.substr(begin, end - begin));
    begin = end + 1;
  }
  return segments;
}

}  // namespace

bool validate(const dwn::schema::records_write_descriptor_t& descriptor,
              std::string& error) {
  if (!check_record_id(descriptor.record_id, error)) {
    return false;
  }
  if (descriptor.data_format.empty()) {
    error = "dataFormat is missing";
    return false;
  }
  if (descriptor.protocol.has_value() != descriptor.protocol_path.has_value()) {
    error = "protocol and protocolPath must be given together";
    return false;
  }
  return check_url(descriptor.protocol, "protocol", error) &&
         check_url(descriptor.schema, "schema", error);
}

bool validate(const dwn::schema::records_delete_descriptor_t& descriptor,
              std::string& error) {
  return check_record_id(descriptor.record_id, error);
}

bool validate(const dwn::schema::records_query_descriptor_t& descriptor,
              std::string& error) {
  if (descriptor.date_sort &&
      !dwn::schema::try_from_string<dwn::schema::date_sort_t>(
          *descriptor.date_sort)) {
    error = "unknown dateSort '" + *descriptor.date_sort + "'";
    return false;
  }
  return check_url(descriptor.filter.protocol, "protocol", error) &&
         check_url(descriptor.filter.schema, "schema", error);
}

bool validate(const dwn::schema::records_read_descriptor_t& descriptor,
              std::string& error) {
  return check_record_id(descriptor.record_id, error);
}

bool validate(const dwn::schema::protocols_configure_descriptor_t& descriptor,
              std::string& error) {
  const auto& definition = descriptor.definition;
  if (definition.protocol.empty()) {
    error = "protocol is missing";
    return false;
  }
  if (!check_url(definition.protocol, "protocol", error)) {
    return false;
  }

  auto type_names = std::set<std::string>{};
  for (const auto& type : definition.types) {
    if (type.name.empty() || type.name.find('/') != std::string::npos) {
      error = "protocol type name '" + type.name + "' is invalid";
      return false;
    }
    if (!type_names.insert(type.name).second) {
      error = "protocol type '" + type.name + "' is declared twice";
      return false;
    }
    if (!check_url(type.schema, "schema", error)) {
      return false;
    }
  }

  for (const auto& rule : definition.rules) {
    for (const auto& segment : split_path(rule.protocol_path)) {
      if (!type_names.contains(segment)) {
        error = "protocol path '" + rule.protocol_path +
                "' names an undeclared type";
        return false;
      }
    }
    for (const auto& action : rule.anyone_can) {
      if (action != dwn::schema::kProtocolActionRead &&
          action != dwn::schema::kProtocolActionWrite) {
        error = "unknown protocol action '" + action + "'";
        return false;
      }
    }
  }
  return true;
}

bool validate(const dwn::schema::protocols_query_descriptor_t& descriptor,
              std::string& error) {
  return check_url(descriptor.filter.protocol, "protocol", error);
}

bool validate(const dwn::schema::events_get_descriptor_t&, std::string&) {
  return true;
}

bool validate(const dwn::schema::messages_get_descriptor_t& descriptor,
              std::string& error) {
  if (descriptor.message_cids.empty()) {
    error = "messageCids is empty";
    return false;
  }
  return true;
}

bool check_integrity(const dwn::schema::raw_message_t& message,
                     std::string& error) {
  if (!message.authorization) {
    error = "authorization is missing";
    return false;
  }
  const auto& authorization = *message.authorization;
  if (authorization.signatures.size() != 1) {
    error = "expected exactly one signature, got " +
            std::to_string(authorization.signatures.size());
    return false;
  }
  if (!author_of_key_id(authorization.signatures.front().key_id)) {
    error = "key id '" + authorization.signatures.front().key_id +
            "' is not of the form <did>#<fragment>";
    return false;
  }
  if (authorization.payload.descriptor_cid !=
      descriptor_cid_of(message.descriptor)) {
    error = "signed descriptor cid does not match the descriptor";
    return false;
  }
  return true;
}

}  // namespace dwn::core
