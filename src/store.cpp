#include <amstore/store.hpp>

#include <amstore/error.hpp>
#include <amstore/json.hpp>
#include <amstore/log.hpp>

#include <array>
#include <exception>

namespace amstore {

namespace {

auto not_found(std::string_view key) -> Exception {
    return Exception{ErrorKind::not_found, "no document at key '" + std::string{key} + "'"};
}

auto map_path(std::string_view raw) -> Path {
    if (raw.empty()) return Path{};
    return Path::parse(raw);
}

}  // anonymous namespace

auto change_channel(std::string_view key) -> std::string {
    return "changes:" + std::string{key};
}

auto base64_encode(std::span<const std::byte> data) -> std::string {
    static constexpr char table[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    auto result = std::string{};
    auto n = data.size();
    result.reserve(((n + 2) / 3) * 4);
    for (std::size_t i = 0; i < n; i += 3) {
        auto b0 = static_cast<unsigned char>(data[i]);
        auto b1 = (i + 1 < n) ? static_cast<unsigned char>(data[i + 1]) : 0u;
        auto b2 = (i + 2 < n) ? static_cast<unsigned char>(data[i + 2]) : 0u;
        result.push_back(table[b0 >> 2]);
        result.push_back(table[((b0 & 0x03) << 4) | (b1 >> 4)]);
        result.push_back((i + 1 < n) ? table[((b1 & 0x0F) << 2) | (b2 >> 6)] : '=');
        result.push_back((i + 2 < n) ? table[b2 & 0x3F] : '=');
    }
    return result;
}

auto base64_decode(std::string_view text) -> std::vector<std::byte> {
    static const auto decode_table = []() {
        auto t = std::array<int, 256>{};
        t.fill(-1);
        constexpr std::string_view chars =
            "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
        for (std::size_t i = 0; i < chars.size(); ++i) {
            t[static_cast<unsigned char>(chars[i])] = static_cast<int>(i);
        }
        return t;
    }();

    if (text.size() % 4 != 0) {
        throw Exception{ErrorKind::decode_error, "base64 length is not a multiple of 4"};
    }
    auto result = std::vector<std::byte>{};
    result.reserve((text.size() / 4) * 3);
    for (std::size_t i = 0; i < text.size(); i += 4) {
        const bool last = i + 4 == text.size();
        const bool pad2 = last && text[i + 2] == '=';
        const bool pad3 = last && text[i + 3] == '=';
        if (pad2 && !pad3) throw Exception{ErrorKind::decode_error, "bad base64 padding"};

        auto sextet = [&](std::size_t pos) {
            auto v = decode_table[static_cast<unsigned char>(text[pos])];
            if (v < 0) {
                throw Exception{ErrorKind::decode_error,
                    "invalid base64 character at offset " + std::to_string(pos)};
            }
            return static_cast<unsigned>(v);
        };
        auto a = sextet(i);
        auto b = sextet(i + 1);
        auto c = pad2 ? 0u : sextet(i + 2);
        auto d = pad3 ? 0u : sextet(i + 3);

        result.push_back(std::byte(((a << 2) | (b >> 4)) & 0xFF));
        if (!pad2) result.push_back(std::byte((((b & 0x0F) << 4) | (c >> 2)) & 0xFF));
        if (!pad3) result.push_back(std::byte((((c & 0x03) << 6) | d) & 0xFF));
    }
    return result;
}

// -- Plumbing -----------------------------------------------------------------

auto DocumentStore::find(std::string_view key) -> Document& {
    auto it = docs_.find(key);
    if (it == docs_.end()) throw not_found(key);
    return it->second;
}

auto DocumentStore::find(std::string_view key) const -> const Document& {
    auto it = docs_.find(key);
    if (it == docs_.end()) throw not_found(key);
    return it->second;
}

void DocumentStore::notify(std::string_view command, std::string_view key,
                           const std::optional<std::vector<std::byte>>& change) {
    if (change && change_listener_) {
        try {
            change_listener_(key, *change);
        } catch (const std::exception& e) {
            if (detail::log_enabled()) {
                detail::log(LogLevel::warn, "change listener failed for '" + std::string{key} +
                            "': " + e.what());
            }
        }
    }
    if (event_listener_) {
        const auto event = "am." + std::string{command};
        try {
            event_listener_(event, key);
        } catch (const std::exception& e) {
            if (detail::log_enabled()) {
                detail::log(LogLevel::warn, "event listener failed for " + event + ": " + e.what());
            }
        }
    }
}

void DocumentStore::write(std::string_view command, std::string_view key,
                          const std::function<void(Document&)>& fn) {
    auto& doc = find(key);
    fn(doc);
    notify(command, key, doc.last_change());
}

// -- Document lifecycle -------------------------------------------------------

void DocumentStore::new_document(std::string_view key) {
    docs_.insert_or_assign(std::string{key}, Document{options_});
    if (detail::log_enabled()) {
        detail::log(LogLevel::info, "created document '" + std::string{key} + "'");
    }
    notify("new", key, std::nullopt);
}

auto DocumentStore::save(std::string_view key) const -> std::vector<std::byte> {
    return find(key).save();
}

void DocumentStore::load(std::string_view key, std::span<const std::byte> data) {
    auto doc = Document::load(data, options_);
    docs_.insert_or_assign(std::string{key}, std::move(doc));
    if (detail::log_enabled()) {
        detail::log(LogLevel::info, "loaded document '" + std::string{key} + "'");
    }
    notify("load", key, std::nullopt);
}

void DocumentStore::apply(std::string_view key, const std::vector<std::vector<std::byte>>& changes) {
    write("apply", key, [&](Document& doc) { doc.apply_changes(changes); });
}

auto DocumentStore::remove(std::string_view key) -> bool {
    auto it = docs_.find(key);
    if (it == docs_.end()) return false;
    docs_.erase(it);
    if (detail::log_enabled()) {
        detail::log(LogLevel::info, "removed document '" + std::string{key} + "'");
    }
    notify("del", key, std::nullopt);
    return true;
}

auto DocumentStore::contains(std::string_view key) const -> bool {
    return docs_.find(key) != docs_.end();
}

auto DocumentStore::keys() const -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    result.reserve(docs_.size());
    for (const auto& [key, doc] : docs_) result.push_back(key);
    return result;
}

auto DocumentStore::document(std::string_view key) -> Document& {
    return find(key);
}

auto DocumentStore::document(std::string_view key) const -> const Document& {
    return find(key);
}

// -- Scalars ------------------------------------------------------------------

void DocumentStore::put_text(std::string_view key, std::string_view path, std::string_view value) {
    auto p = Path::parse(path);
    write("puttext", key, [&](Document& doc) { doc.put_text(p, value); });
}

void DocumentStore::put_int(std::string_view key, std::string_view path, std::int64_t value) {
    auto p = Path::parse(path);
    write("putint", key, [&](Document& doc) { doc.put_int(p, value); });
}

void DocumentStore::put_double(std::string_view key, std::string_view path, double value) {
    auto p = Path::parse(path);
    write("putdouble", key, [&](Document& doc) { doc.put_double(p, value); });
}

void DocumentStore::put_bool(std::string_view key, std::string_view path, bool value) {
    auto p = Path::parse(path);
    write("putbool", key, [&](Document& doc) { doc.put_bool(p, value); });
}

void DocumentStore::put_counter(std::string_view key, std::string_view path, std::int64_t value) {
    auto p = Path::parse(path);
    write("putcounter", key, [&](Document& doc) { doc.put_counter(p, value); });
}

void DocumentStore::put_timestamp(std::string_view key, std::string_view path, std::int64_t millis) {
    auto p = Path::parse(path);
    write("puttimestamp", key, [&](Document& doc) { doc.put_timestamp(p, millis); });
}

auto DocumentStore::get_text(std::string_view key, std::string_view path) const -> std::string {
    auto p = Path::parse(path);
    return find(key).get_text(p);
}

auto DocumentStore::get_int(std::string_view key, std::string_view path) const -> std::int64_t {
    auto p = Path::parse(path);
    return find(key).get_int(p);
}

auto DocumentStore::get_double(std::string_view key, std::string_view path) const -> double {
    auto p = Path::parse(path);
    return find(key).get_double(p);
}

auto DocumentStore::get_bool(std::string_view key, std::string_view path) const -> bool {
    auto p = Path::parse(path);
    return find(key).get_bool(p);
}

auto DocumentStore::get_counter(std::string_view key, std::string_view path) const -> std::int64_t {
    auto p = Path::parse(path);
    return find(key).get_counter(p);
}

auto DocumentStore::get_timestamp(std::string_view key, std::string_view path) const -> std::int64_t {
    auto p = Path::parse(path);
    return find(key).get_timestamp(p);
}

void DocumentStore::inc_counter(std::string_view key, std::string_view path, std::int64_t delta) {
    auto p = Path::parse(path);
    write("inccounter", key, [&](Document& doc) { doc.increment_counter(p, delta); });
}

// -- Lists, maps and text -----------------------------------------------------

void DocumentStore::create_list(std::string_view key, std::string_view path) {
    auto p = Path::parse(path);
    write("createlist", key, [&](Document& doc) { doc.create_list(p); });
}

void DocumentStore::append_text(std::string_view key, std::string_view path, std::string_view value) {
    auto p = Path::parse(path);
    write("appendtext", key, [&](Document& doc) { doc.append_text(p, value); });
}

void DocumentStore::append_int(std::string_view key, std::string_view path, std::int64_t value) {
    auto p = Path::parse(path);
    write("appendint", key, [&](Document& doc) { doc.append_int(p, value); });
}

void DocumentStore::append_double(std::string_view key, std::string_view path, double value) {
    auto p = Path::parse(path);
    write("appenddouble", key, [&](Document& doc) { doc.append_double(p, value); });
}

void DocumentStore::append_bool(std::string_view key, std::string_view path, bool value) {
    auto p = Path::parse(path);
    write("appendbool", key, [&](Document& doc) { doc.append_bool(p, value); });
}

auto DocumentStore::list_len(std::string_view key, std::string_view path) const -> std::size_t {
    auto p = Path::parse(path);
    return find(key).list_len(p);
}

auto DocumentStore::map_len(std::string_view key, std::string_view path) const -> std::size_t {
    auto p = map_path(path);
    return find(key).map_len(p);
}

void DocumentStore::splice_text(std::string_view key, std::string_view path, std::int64_t start,
                                std::int64_t delete_count, std::string_view insert) {
    auto p = Path::parse(path);
    write("splicetext", key, [&](Document& doc) { doc.splice_text(p, start, delete_count, insert); });
}

void DocumentStore::put_diff(std::string_view key, std::string_view path, std::string_view diff) {
    auto p = Path::parse(path);
    write("putdiff", key, [&](Document& doc) { doc.put_diff(p, diff); });
}

// -- JSON and history ---------------------------------------------------------

auto DocumentStore::to_json(std::string_view key, bool pretty) const -> std::string {
    return json::to_string(find(key), pretty);
}

void DocumentStore::from_json(std::string_view key, std::string_view text) {
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        throw Exception{ErrorKind::parse_error, "malformed JSON"};
    }
    auto doc = Document{options_};
    json::import_json(doc, parsed);
    auto change = doc.last_change();
    docs_.insert_or_assign(std::string{key}, std::move(doc));
    notify("fromjson", key, change);
}

auto DocumentStore::changes(std::string_view key, const std::vector<ChangeHash>& since) const
    -> std::vector<std::vector<std::byte>> {
    return find(key).get_changes(since);
}

auto DocumentStore::num_changes(std::string_view key) const -> std::size_t {
    return find(key).num_changes();
}

}  // namespace amstore
