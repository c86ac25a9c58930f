// Fuzz target for Path::parse(). Every accepted path must print back to a
// string that, behind a "$." prefix, parses to the same segments.

#include <amstore/amstore.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto raw = std::string_view(reinterpret_cast<const char*>(data), size);

    try {
        auto path = amstore::Path::parse(raw);
        auto printed = "$." + path.to_string();
        if (amstore::Path::parse(printed) != path) std::abort();
    } catch (const amstore::Exception&) {
        // parse_error
    }
    return 0;
}
