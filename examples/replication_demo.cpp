// replication_demo: a host store publishing change records to a replica
//
// Demonstrates: DocumentStore commands, the change and event listeners,
//               base64 transport of change records, out-of-order delivery
//               and JSON import/export.

#include <amstore/amstore.hpp>

#include <cstdio>
#include <string>
#include <vector>

namespace am = amstore;

int main() {
    am::set_log_sink([](am::LogLevel level, std::string_view msg) {
        std::printf("[%.*s] %.*s\n", static_cast<int>(am::to_string_view(level).size()),
                    am::to_string_view(level).data(), static_cast<int>(msg.size()), msg.data());
    });

    // The "channel" carries base64 text, the way a pub/sub payload would.
    auto channel = std::vector<std::string>{};

    auto primary = am::DocumentStore{};
    primary.on_change([&channel](std::string_view key, std::span<const std::byte> change) {
        std::printf("publish %s (%zu bytes)\n", am::change_channel(key).c_str(), change.size());
        channel.push_back(am::base64_encode(change));
    });
    primary.on_event([](std::string_view event, std::string_view key) {
        std::printf("event %.*s on %.*s\n", static_cast<int>(event.size()), event.data(),
                    static_cast<int>(key.size()), key.data());
    });

    primary.from_json("profile", R"({"name": "Ada", "langs": ["en"]})");
    primary.put_int("profile", "stats.logins", 1);
    primary.append_text("profile", "langs", "fr");
    primary.put_text("profile", "bio", "Mathematician");
    primary.splice_text("profile", "bio", 0, 0, "Pioneering ");

    // The replica starts from the first record and receives the rest
    // in reverse order; records wait until their dependencies arrive.
    auto replica = am::DocumentStore{};
    replica.new_document("profile");
    replica.apply("profile", {am::base64_decode(channel.front())});
    for (auto it = channel.rbegin(); it != channel.rend() - 1; ++it) {
        replica.apply("profile", {am::base64_decode(*it)});
        std::printf("replica pending: %zu\n", replica.document("profile").pending_changes());
    }

    std::printf("\nprimary: %s\nreplica: %s\n", primary.to_json("profile").c_str(),
                replica.to_json("profile").c_str());

    // Failures are reported without touching the document.
    try {
        primary.inc_counter("profile", "stats.logins", 1);
    } catch (const am::Exception& e) {
        std::printf("\nrejected: %s\n", e.what());
    }

    am::set_log_sink(nullptr);
    return 0;
}
