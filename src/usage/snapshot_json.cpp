#include "tallykeep/usage/snapshot_json.hpp"

#include "tallykeep/common/fs.hpp"
#include "tallykeep/common/json_util.hpp"

#include <initializer_list>
#include <sstream>
#include <utility>

namespace tallykeep::usage {

namespace {

std::string pad(const int depth) { return std::string(static_cast<std::size_t>(depth) * 2, ' '); }

void write_counter_map(std::ostringstream &out, const std::map<std::string, std::int64_t> &values,
                       const int depth) {
  if (values.empty()) {
    out << "{}";
    return;
  }
  out << "{\n";
  bool first = true;
  for (const auto &[key, value] : values) {
    if (!first) {
      out << ",\n";
    }
    first = false;
    out << pad(depth + 1) << common::json_quote(key) << ": " << value;
  }
  out << "\n" << pad(depth) << "}";
}

void write_tokens(std::ostringstream &out, const TokenStats &tokens, const int depth) {
  out << "{\n";
  out << pad(depth + 1) << "\"input_tokens\": " << tokens.input_tokens << ",\n";
  out << pad(depth + 1) << "\"output_tokens\": " << tokens.output_tokens << ",\n";
  out << pad(depth + 1) << "\"reasoning_tokens\": " << tokens.reasoning_tokens << ",\n";
  out << pad(depth + 1) << "\"cached_tokens\": " << tokens.cached_tokens << ",\n";
  out << pad(depth + 1) << "\"total_tokens\": " << tokens.total_tokens << "\n";
  out << pad(depth) << "}";
}

void write_detail(std::ostringstream &out, const RequestDetail &detail, const int depth) {
  out << "{\n";
  out << pad(depth + 1) << "\"timestamp\": " << common::json_quote(detail.timestamp) << ",\n";
  out << pad(depth + 1) << "\"source\": " << common::json_quote(detail.source) << ",\n";
  out << pad(depth + 1) << "\"auth_index\": " << common::json_quote(detail.auth_index) << ",\n";
  out << pad(depth + 1) << "\"tokens\": ";
  write_tokens(out, detail.tokens, depth + 1);
  out << ",\n";
  out << pad(depth + 1) << "\"failed\": " << (detail.failed ? "true" : "false") << "\n";
  out << pad(depth) << "}";
}

void write_model(std::ostringstream &out, const ModelSnapshot &model, const int depth) {
  out << "{\n";
  out << pad(depth + 1) << "\"total_requests\": " << model.total_requests << ",\n";
  out << pad(depth + 1) << "\"total_tokens\": " << model.total_tokens << ",\n";
  out << pad(depth + 1) << "\"details\": ";
  if (model.details.empty()) {
    out << "[]";
  } else {
    out << "[\n";
    for (std::size_t i = 0; i < model.details.size(); ++i) {
      out << pad(depth + 2);
      write_detail(out, model.details[i], depth + 2);
      out << (i + 1 < model.details.size() ? ",\n" : "\n");
    }
    out << pad(depth + 1) << "]";
  }
  out << "\n" << pad(depth) << "}";
}

void write_api(std::ostringstream &out, const ApiSnapshot &api, const int depth) {
  out << "{\n";
  out << pad(depth + 1) << "\"total_requests\": " << api.total_requests << ",\n";
  out << pad(depth + 1) << "\"total_tokens\": " << api.total_tokens << ",\n";
  out << pad(depth + 1) << "\"models\": ";
  if (api.models.empty()) {
    out << "{}";
  } else {
    out << "{\n";
    bool first = true;
    for (const auto &[name, model] : api.models) {
      if (!first) {
        out << ",\n";
      }
      first = false;
      out << pad(depth + 2) << common::json_quote(name) << ": ";
      write_model(out, model, depth + 2);
    }
    out << "\n" << pad(depth + 1) << "}";
  }
  out << "\n" << pad(depth) << "}";
}

bool is_object(const std::string &raw) { return !raw.empty() && raw.front() == '{'; }

common::Status read_int(const common::JsonFlatMap &fields, const std::string &key,
                        std::int64_t &out) {
  const auto it = fields.find(key);
  if (it == fields.end() || common::json_is_null(it->second)) {
    return common::Status::success();
  }
  const auto parsed = common::json_to_int(it->second);
  if (!parsed.has_value()) {
    return common::Status::error("field \"" + key + "\" is not an integer");
  }
  out = *parsed;
  return common::Status::success();
}

common::Status read_ints(const common::JsonFlatMap &fields,
                         std::initializer_list<std::pair<const char *, std::int64_t *>> targets) {
  for (const auto &[key, target] : targets) {
    auto status = read_int(fields, key, *target);
    if (!status.ok()) {
      return status;
    }
  }
  return common::Status::success();
}

common::Status read_bool(const common::JsonFlatMap &fields, const std::string &key, bool &out) {
  const auto it = fields.find(key);
  if (it == fields.end() || common::json_is_null(it->second)) {
    return common::Status::success();
  }
  const auto parsed = common::json_to_bool(it->second);
  if (!parsed.has_value()) {
    return common::Status::error("field \"" + key + "\" is not a boolean");
  }
  out = *parsed;
  return common::Status::success();
}

common::Status read_string(const common::JsonFlatMap &fields, const std::string &key,
                           std::string &out) {
  const auto it = fields.find(key);
  if (it == fields.end() || common::json_is_null(it->second)) {
    return common::Status::success();
  }
  auto parsed = common::json_to_string(it->second);
  if (!parsed.has_value()) {
    return common::Status::error("field \"" + key + "\" is not a string");
  }
  out = std::move(*parsed);
  return common::Status::success();
}

common::Status read_strings(const common::JsonFlatMap &fields,
                            std::initializer_list<std::pair<const char *, std::string *>> targets) {
  for (const auto &[key, target] : targets) {
    auto status = read_string(fields, key, *target);
    if (!status.ok()) {
      return status;
    }
  }
  return common::Status::success();
}

common::Result<common::JsonFlatMap> read_object(const std::string &raw, const std::string &what) {
  if (common::json_is_null(raw)) {
    return common::Result<common::JsonFlatMap>::success({});
  }
  if (!is_object(raw)) {
    return common::Result<common::JsonFlatMap>::failure(what + " is not an object");
  }
  return common::Result<common::JsonFlatMap>::success(common::json_parse_flat(raw));
}

common::Status read_counter_map(const common::JsonFlatMap &fields, const std::string &key,
                                std::map<std::string, std::int64_t> &out) {
  const auto it = fields.find(key);
  if (it == fields.end()) {
    return common::Status::success();
  }
  auto object = read_object(it->second, "field \"" + key + "\"");
  if (!object.ok()) {
    return common::Status::error(object.error());
  }
  for (const auto &[bucket, raw] : object.value()) {
    const auto parsed = common::json_to_int(raw);
    if (!parsed.has_value()) {
      return common::Status::error("field \"" + key + "." + bucket + "\" is not an integer");
    }
    out[bucket] = *parsed;
  }
  return common::Status::success();
}

common::Result<TokenStats> decode_tokens(const std::string &raw) {
  auto object = read_object(raw, "tokens");
  if (!object.ok()) {
    return common::Result<TokenStats>::failure(object.error());
  }
  const auto &fields = object.value();
  TokenStats tokens;
  auto status = read_ints(fields, {{"input_tokens", &tokens.input_tokens},
                                   {"output_tokens", &tokens.output_tokens},
                                   {"reasoning_tokens", &tokens.reasoning_tokens},
                                   {"cached_tokens", &tokens.cached_tokens},
                                   {"total_tokens", &tokens.total_tokens}});
  if (!status.ok()) {
    return common::Result<TokenStats>::failure(status.error());
  }
  return common::Result<TokenStats>::success(tokens);
}

common::Result<RequestDetail> decode_detail(const std::string &raw) {
  auto object = read_object(raw, "detail");
  if (!object.ok()) {
    return common::Result<RequestDetail>::failure(object.error());
  }
  const auto &fields = object.value();
  RequestDetail detail;
  auto strings = read_strings(fields, {{"timestamp", &detail.timestamp},
                                       {"source", &detail.source},
                                       {"auth_index", &detail.auth_index}});
  if (!strings.ok()) {
    return common::Result<RequestDetail>::failure(strings.error());
  }
  if (const auto it = fields.find("tokens"); it != fields.end()) {
    auto tokens = decode_tokens(it->second);
    if (!tokens.ok()) {
      return common::Result<RequestDetail>::failure(tokens.error());
    }
    detail.tokens = tokens.value();
  }
  auto status = read_bool(fields, "failed", detail.failed);
  if (!status.ok()) {
    return common::Result<RequestDetail>::failure(status.error());
  }
  return common::Result<RequestDetail>::success(std::move(detail));
}

common::Result<ModelSnapshot> decode_model(const std::string &raw) {
  auto object = read_object(raw, "model");
  if (!object.ok()) {
    return common::Result<ModelSnapshot>::failure(object.error());
  }
  const auto &fields = object.value();
  ModelSnapshot model;
  auto status = read_ints(fields, {{"total_requests", &model.total_requests},
                                   {"total_tokens", &model.total_tokens}});
  if (!status.ok()) {
    return common::Result<ModelSnapshot>::failure(status.error());
  }

  const auto it = fields.find("details");
  if (it == fields.end() || common::json_is_null(it->second)) {
    return common::Result<ModelSnapshot>::success(std::move(model));
  }
  const std::string &array = it->second;
  if (array.front() != '[') {
    return common::Result<ModelSnapshot>::failure("field \"details\" is not an array");
  }
  const auto items = common::json_split_top_level_objects(array);
  if (items.empty() && common::json_skip_ws(array, 1) != array.size() - 1) {
    return common::Result<ModelSnapshot>::failure("field \"details\" holds non-object items");
  }
  for (const auto &item : items) {
    auto detail = decode_detail(item);
    if (!detail.ok()) {
      return common::Result<ModelSnapshot>::failure(detail.error());
    }
    model.details.push_back(std::move(detail.value()));
  }
  return common::Result<ModelSnapshot>::success(std::move(model));
}

common::Result<ApiSnapshot> decode_api(const std::string &raw) {
  auto object = read_object(raw, "api");
  if (!object.ok()) {
    return common::Result<ApiSnapshot>::failure(object.error());
  }
  const auto &fields = object.value();
  ApiSnapshot api;
  auto status = read_ints(fields, {{"total_requests", &api.total_requests},
                                   {"total_tokens", &api.total_tokens}});
  if (!status.ok()) {
    return common::Result<ApiSnapshot>::failure(status.error());
  }
  if (const auto it = fields.find("models"); it != fields.end()) {
    auto models = read_object(it->second, "field \"models\"");
    if (!models.ok()) {
      return common::Result<ApiSnapshot>::failure(models.error());
    }
    for (const auto &[name, model_raw] : models.value()) {
      auto model = decode_model(model_raw);
      if (!model.ok()) {
        return common::Result<ApiSnapshot>::failure("model \"" + name + "\": " + model.error());
      }
      api.models[name] = std::move(model.value());
    }
  }
  return common::Result<ApiSnapshot>::success(std::move(api));
}

} // namespace

std::string snapshot_to_json(const StatisticsSnapshot &snapshot, const int indent) {
  std::ostringstream out;
  const int depth = indent;
  out << "{\n";
  out << pad(depth + 1) << "\"total_requests\": " << snapshot.total_requests << ",\n";
  out << pad(depth + 1) << "\"success_count\": " << snapshot.success_count << ",\n";
  out << pad(depth + 1) << "\"failure_count\": " << snapshot.failure_count << ",\n";
  out << pad(depth + 1) << "\"total_tokens\": " << snapshot.total_tokens << ",\n";
  out << pad(depth + 1) << "\"apis\": ";
  if (snapshot.apis.empty()) {
    out << "{}";
  } else {
    out << "{\n";
    bool first = true;
    for (const auto &[name, api] : snapshot.apis) {
      if (!first) {
        out << ",\n";
      }
      first = false;
      out << pad(depth + 2) << common::json_quote(name) << ": ";
      write_api(out, api, depth + 2);
    }
    out << "\n" << pad(depth + 1) << "}";
  }
  out << ",\n" << pad(depth + 1) << "\"requests_by_day\": ";
  write_counter_map(out, snapshot.requests_by_day, depth + 1);
  out << ",\n" << pad(depth + 1) << "\"requests_by_hour\": ";
  write_counter_map(out, snapshot.requests_by_hour, depth + 1);
  out << ",\n" << pad(depth + 1) << "\"tokens_by_day\": ";
  write_counter_map(out, snapshot.tokens_by_day, depth + 1);
  out << ",\n" << pad(depth + 1) << "\"tokens_by_hour\": ";
  write_counter_map(out, snapshot.tokens_by_hour, depth + 1);
  out << "\n" << pad(depth) << "}";
  return out.str();
}

common::Result<StatisticsSnapshot> snapshot_from_json(const std::string &json) {
  const std::string trimmed = common::trim(json);
  auto object = read_object(trimmed, "usage snapshot");
  if (!object.ok()) {
    return common::Result<StatisticsSnapshot>::failure(object.error());
  }
  const auto &fields = object.value();

  StatisticsSnapshot snapshot;
  auto totals = read_ints(fields, {{"total_requests", &snapshot.total_requests},
                                   {"success_count", &snapshot.success_count},
                                   {"failure_count", &snapshot.failure_count},
                                   {"total_tokens", &snapshot.total_tokens}});
  if (!totals.ok()) {
    return common::Result<StatisticsSnapshot>::failure(totals.error());
  }

  if (const auto it = fields.find("apis"); it != fields.end()) {
    auto apis = read_object(it->second, "field \"apis\"");
    if (!apis.ok()) {
      return common::Result<StatisticsSnapshot>::failure(apis.error());
    }
    for (const auto &[name, api_raw] : apis.value()) {
      auto api = decode_api(api_raw);
      if (!api.ok()) {
        return common::Result<StatisticsSnapshot>::failure("api \"" + name + "\": " +
                                                           api.error());
      }
      snapshot.apis[name] = std::move(api.value());
    }
  }

  const std::pair<const char *, std::map<std::string, std::int64_t> *> breakdowns[] = {
      {"requests_by_day", &snapshot.requests_by_day},
      {"requests_by_hour", &snapshot.requests_by_hour},
      {"tokens_by_day", &snapshot.tokens_by_day},
      {"tokens_by_hour", &snapshot.tokens_by_hour}};
  for (const auto &[key, target] : breakdowns) {
    auto status = read_counter_map(fields, key, *target);
    if (!status.ok()) {
      return common::Result<StatisticsSnapshot>::failure(status.error());
    }
  }
  return common::Result<StatisticsSnapshot>::success(std::move(snapshot));
}

} // namespace tallykeep::usage
