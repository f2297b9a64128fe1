#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace voice_gateway {

// Cuts a streamed reply into units that can be synthesized on their own.
// A unit ends at a sentence boundary, at a clause boundary once it is long
// enough, or at whitespace when it grows past the maximum. Punctuation at the
// very end of the buffer waits for the next increment, so "$500." followed by
// "25" stays one number.
class ResponseStreamer {
public:
    using UnitHandler = std::function<void(const std::string& unit)>;

    ResponseStreamer(size_t min_clause_chars, size_t max_unit_chars, UnitHandler handler);

    void feed(const std::string& increment);
    // End of reply: forwards whatever is buffered.
    void finish();
    // Stops forwarding; safe to call from another thread.
    void cancel();

    bool cancelled() const { return cancelled_.load(); }
    size_t units_forwarded() const { return units_forwarded_; }
    const std::string& buffered() const { return buffer_; }

private:
    std::optional<size_t> find_boundary() const;
    std::optional<size_t> find_forced_split() const;
    void drain();
    void forward(const std::string& raw);

    size_t min_clause_chars_;
    size_t max_unit_chars_;
    UnitHandler handler_;
    std::string buffer_;
    size_t units_forwarded_ = 0;
    std::atomic<bool> cancelled_{false};
};

}
