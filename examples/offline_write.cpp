// Walks one offline write through the local view and the backend's
// acknowledgment.

#include <docsync-cpp/docsync.hpp>
#include <docsync-cpp/json.hpp>

#include <cstdio>
#include <optional>
#include <vector>

using namespace docsync_cpp;

static void print(const char* label, const std::optional<MaybeDocument>& maybe_doc) {
    if (!maybe_doc) {
        std::printf("%-14s (unknown)\n", label);
        return;
    }
    std::printf("%-14s %s\n", label, nlohmann::json(*maybe_doc).dump().c_str());
}

int main() {
    const auto key = DocumentKey::from_path_string("rooms/eros");

    // The cache knows the document at version 3.
    const auto cached = std::optional<MaybeDocument>{
        Document{key, SnapshotVersion{Timestamp{3, 0}},
                 make_object({{"topic", "chat"}, {"owner", make_object({{"name", "ada"}})}})}};
    print("cached:", cached);

    // The user renames the owner and stamps the update time in one batch.
    const auto batch = std::vector<Mutation>{
        PatchMutation{key, make_object({{"owner", make_object({{"name", "grace"}})}}),
                      FieldMask{FieldPath::from_dot_separated("owner.name")},
                      Precondition::exists(true)},
        TransformMutation{key, {
            FieldTransform{FieldPath{"updated"}, TransformOperation::server_timestamp()},
        }},
    };

    // Optimistic view while offline.
    const auto write_time = Timestamp::now();
    auto local = cached;
    for (const auto& m : batch) {
        local = apply_to_local_view(m, local, cached, write_time);
    }
    print("local view:", local);

    // The backend commits the batch and reports the server timestamp.
    const auto committed = FieldValue{Timestamp{1'700'000'000, 0}};
    const auto results = std::vector<MutationResult>{
        MutationResult{SnapshotVersion{Timestamp{4, 0}}},
        MutationResult{SnapshotVersion{Timestamp{4, 0}}, std::vector<FieldValue>{committed}},
    };
    auto remote = cached;
    for (std::size_t i = 0; i < batch.size(); ++i) {
        remote = apply_to_remote_document(batch[i], remote, results[i]);
    }
    print("acknowledged:", remote);

    // A delete that has not been acknowledged yet leaves a local tombstone.
    const auto tombstone = DeleteMutation{key}.apply_to_local_view(remote, remote, Timestamp::now());
    print("deleted:", tombstone);

    return 0;
}
