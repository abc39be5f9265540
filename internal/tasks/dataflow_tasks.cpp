#include "dataflow_tasks.hpp"

#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace launchpad::tasks {

using namespace launchpad::core::v1;
using google::protobuf::Struct;
using google::protobuf::Value;

namespace {

const Value* Find(const Struct& s, const std::string& key) {
  auto it = s.fields().find(key);
  return it == s.fields().end() ? nullptr : &it->second;
}

std::string RequireString(const Struct& params, const std::string& key, const char* task) {
  const auto* value = Find(params, key);
  if (!value || !value->has_string_value()) {
    throw util::InvalidArgument(std::string(task) + ": '" + key + "' must be a single string");
  }
  return value->string_value();
}

// A string or a list of strings.
std::vector<std::string> RequireKeys(const Struct& params, const std::string& key, const char* task) {
  const auto* value = Find(params, key);
  if (value && value->has_string_value()) return {value->string_value()};
  if (!value || !value->has_list_value()) {
    throw util::InvalidArgument(std::string(task) + ": '" + key + "' must be a string or a list");
  }

  std::vector<std::string> keys;
  for (const auto& item : value->list_value().values()) {
    if (!item.has_string_value()) {
      throw util::InvalidArgument(std::string(task) + ": '" + key + "' must only contain strings");
    }
    keys.push_back(item.string_value());
  }
  return keys;
}

const Value& SpecValue(const Struct& spec, const std::string& key, const char* task) {
  const auto* value = Find(spec, key);
  if (!value) {
    throw util::InvalidArgument(std::string(task) + ": spec has no key '" + key + "'");
  }
  return *value;
}

FWAction Publish(const std::string& key, const Value& value) {
  FWAction action;
  (*action.mutable_update_spec()->mutable_fields())[key]       = value;
  (*action.mutable_child_update_spec()->mutable_fields())[key] = value;
  (*action.mutable_stored_data()->mutable_fields())[key]       = value;
  return action;
}

} // namespace

FWAction JoinDictTask::Run(const Struct& spec, const Struct& params) {
  const auto output_key = RequireString(params, "outputs", kName);

  Struct outputs;
  if (const auto* existing = Find(spec, output_key)) {
    if (!existing->has_struct_value()) {
      throw util::InvalidArgument(std::string(kName) + ": '" + output_key + "' exists but is not an object");
    }
    outputs = existing->struct_value();
  }

  const Struct* rename = nullptr;
  if (const auto* value = Find(params, "rename"); value && value->has_struct_value()) {
    rename = &value->struct_value();
  }

  for (const auto& input : RequireKeys(params, "inputs", kName)) {
    std::string target = input;
    if (rename) {
      if (const auto* renamed = Find(*rename, input); renamed && renamed->has_string_value()) target = renamed->string_value();
    }
    (*outputs.mutable_fields())[target] = SpecValue(spec, input, kName);
  }

  Value value;
  *value.mutable_struct_value() = std::move(outputs);
  return Publish(output_key, value);
}

FWAction JoinListTask::Run(const Struct& spec, const Struct& params) {
  const auto output_key = RequireString(params, "outputs", kName);

  Value value;
  if (const auto* existing = Find(spec, output_key)) {
    if (!existing->has_list_value()) {
      throw util::InvalidArgument(std::string(kName) + ": '" + output_key + "' exists but is not a list");
    }
    value = *existing;
  } else {
    value.mutable_list_value();
  }

  for (const auto& input : RequireKeys(params, "inputs", kName)) {
    *value.mutable_list_value()->add_values() = SpecValue(spec, input, kName);
  }
  return Publish(output_key, value);
}

FWAction ForeachTask::Run(const Struct& spec, const Struct& params) {
  const auto split = RequireString(params, "split", kName);

  const auto& items = SpecValue(spec, split, kName);
  if (!items.has_list_value()) {
    throw util::InvalidArgument(std::string(kName) + ": '" + split + "' must point to a list");
  }

  const auto* task = Find(params, "task");
  if (!task || !task->has_struct_value()) {
    throw util::InvalidArgument(std::string(kName) + ": 'task' must be an object {name, params}");
  }
  const auto  task_name   = RequireString(task->struct_value(), "name", kName);
  const auto* task_params = Find(task->struct_value(), "params");

  FWAction action;
  const auto& elements = items.list_value().values();
  if (elements.empty()) {
    action.set_defuse_workflow(true);
    return action;
  }

  auto* detour = action.add_detours();
  detour->set_mode(EXTENSION_MODE_DETOUR);
  auto* branch = detour->mutable_workflow();
  branch->set_name(kName);

  for (int i = 0; i < elements.size(); ++i) {
    auto* fw = branch->add_fireworks();
    fw->set_fw_id(i + 1);
    fw->set_name(std::string(kName) + " " + std::to_string(i));
    *fw->mutable_spec() = spec;
    (*fw->mutable_spec()->mutable_fields())[split] = elements.Get(i);

    auto* step = fw->add_tasks();
    step->set_name(task_name);
    if (task_params && task_params->has_struct_value()) {
      *step->mutable_params() = task_params->struct_value();
    }
  }
  return action;
}

} // namespace launchpad::tasks
