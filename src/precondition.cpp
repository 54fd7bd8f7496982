#include <docsync-cpp/precondition.hpp>

#include <absl/log/absl_check.h>
#include <absl/log/absl_log.h>

namespace docsync_cpp {

auto Precondition::type() const -> PreconditionType {
    ABSL_CHECK(!(update_time_ && exists_))
        << "Precondition can specify \"exists\" or \"update_time\" but not both";
    if (update_time_) return PreconditionType::update_time;
    if (exists_) return PreconditionType::exists;
    return PreconditionType::none;
}

auto Precondition::is_valid_for(const std::optional<MaybeDocument>& maybe_doc) const -> bool {
    switch (type()) {
        case PreconditionType::update_time: {
            const auto* doc = as_document(maybe_doc);
            return doc && doc->version() == *update_time_;
        }
        case PreconditionType::exists:
            if (*exists_) return is_document(maybe_doc);
            return !maybe_doc || is_no_document(maybe_doc);
        case PreconditionType::none:
            return true;
    }
    ABSL_LOG(FATAL) << "Invalid precondition type";
}

}  // namespace docsync_cpp
