/**
 * @file JsonMerge.cpp
 * @brief Implementation of JSON Merge Patch
 */

#include "deepmerge/JsonMerge.hpp"

namespace deepmerge {

void merge_patch(Value& target, Value patch) {
    if (!target.is_object() || !patch.is_object()) {
        target = std::move(patch);
        return;
    }

    for (auto it = patch.begin(); it != patch.end(); ++it) {
        if (it.value().is_null()) {
            target.erase(it.key());
        } else {
            // operator[] inserts null for a missing key; null is then replaced
            merge_patch(target[it.key()], std::move(it.value()));
        }
    }
}

Value merge_patched(const Value& target, const Value& patch) {
    Value result = target;
    merge_patch(result, patch);
    return result;
}

Value merge_patch_all(const std::vector<Value>& documents) {
    if (documents.empty()) {
        return Value::object();
    }

    Value result = documents[0];
    for (size_t i = 1; i < documents.size(); ++i) {
        merge_patch(result, documents[i]);
    }

    return result;
}

} // namespace deepmerge
