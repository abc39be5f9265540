#pragma once

#include <google/protobuf/repeated_field.h>
#include <google/protobuf/struct.pb.h>

#include "launchpad/core/v1/firework.pb.h"

namespace launchpad::model {

// Shallow merge: every top-level key of update replaces the one in spec.
void ApplyUpdateSpec(google::protobuf::Struct& spec, const google::protobuf::Struct& update);

// Appends each value to the list under its key, creating the list if the
// key is absent. Throws util::InvalidArgument if the key holds a non-list.
void ApplyModSpecPush(google::protobuf::Struct& spec, const google::protobuf::RepeatedPtrField<launchpad::core::v1::SpecPush>& pushes);

// Folds a later task's action into the accumulated one. Spec updates and
// stored data merge key-wise, pushes and detours append, flags OR.
void MergeAction(launchpad::core::v1::FWAction& into, const launchpad::core::v1::FWAction& from);

} // namespace launchpad::model
