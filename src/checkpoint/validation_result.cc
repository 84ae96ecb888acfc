#include <chklib/checkpoint/validation_result.hh>
#include <chklib/json_str/json_str.hh>
#include <utility>

namespace chk {

std::string ValidationResult::to_json() const {
    json_str::Object obj;
    obj.prop("passed", passed);
    obj.prop("message", message);
    if (not errors.empty()) {
        obj.prop_arr("errors", [&](auto& arr) {
            for (const auto& error : errors) {
                arr.val(error);
            }
        });
    }
    if (not hints.empty()) {
        obj.prop_arr("hints", [&](auto& arr) {
            for (const auto& hint : hints) {
                arr.val(hint);
            }
        });
    }
    return std::move(obj).into_str();
}

} // namespace chk
