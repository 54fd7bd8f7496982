#include <docsync-cpp/transform.hpp>

#include <absl/log/absl_log.h>

namespace docsync_cpp {

auto local_transform_result(const TransformOperation& op,
                            const std::optional<FieldValue>& previous_value,
                            const Timestamp& local_write_time) -> FieldValue {
    switch (op.type()) {
        case TransformType::server_timestamp:
            return FieldValue{ServerTimestampValue{local_write_time, previous_value}};
    }
    ABSL_LOG(FATAL) << "Encountered unknown transform: "
                    << static_cast<int>(op.type());
}

auto remote_transform_result(const TransformOperation& op,
                             const std::optional<FieldValue>& /*previous_value*/,
                             FieldValue transform_result) -> FieldValue {
    switch (op.type()) {
        case TransformType::server_timestamp:
            return transform_result;
    }
    ABSL_LOG(FATAL) << "Encountered unknown transform: "
                    << static_cast<int>(op.type());
}

}  // namespace docsync_cpp
