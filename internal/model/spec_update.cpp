#include "spec_update.hpp"

#include "internal/util/errors.hpp"

namespace launchpad::model {

void ApplyUpdateSpec(google::protobuf::Struct& spec, const google::protobuf::Struct& update) {
  auto& fields = *spec.mutable_fields();
  for (const auto& [key, value] : update.fields()) {
    fields[key] = value;
  }
}

void ApplyModSpecPush(google::protobuf::Struct& spec, const google::protobuf::RepeatedPtrField<launchpad::core::v1::SpecPush>& pushes) {
  auto& fields = *spec.mutable_fields();
  for (const auto& push : pushes) {
    auto it = fields.find(push.key());
    if (it == fields.end()) {
      *fields[push.key()].mutable_list_value()->add_values() = push.value();
      continue;
    }
    if (!it->second.has_list_value()) {
      throw util::InvalidArgument("cannot push onto non-list spec key '" + push.key() + "'");
    }
    *it->second.mutable_list_value()->add_values() = push.value();
  }
}

void MergeAction(launchpad::core::v1::FWAction& into, const launchpad::core::v1::FWAction& from) {
  ApplyUpdateSpec(*into.mutable_update_spec(), from.update_spec());
  ApplyUpdateSpec(*into.mutable_child_update_spec(), from.child_update_spec());
  ApplyUpdateSpec(*into.mutable_stored_data(), from.stored_data());

  into.mutable_mod_spec_push()->MergeFrom(from.mod_spec_push());
  into.mutable_detours()->MergeFrom(from.detours());

  into.set_defuse_workflow(into.defuse_workflow() || from.defuse_workflow());
  into.set_defuse_children(into.defuse_children() || from.defuse_children());
}

} // namespace launchpad::model
