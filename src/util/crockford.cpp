#include <ulidkit/crockford.hpp>
#include <array>

namespace ulidkit::crockford {

// ---- Tables ----

static constexpr char kAlphabet[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

static constexpr std::array<int8_t, 256> make_decode_table() {
    std::array<int8_t, 256> table{};
    for (std::size_t i = 0; i < table.size(); ++i) {
        table[i] = -1;
    }
    for (int v = 0; v < 32; ++v) {
        unsigned char upper = static_cast<unsigned char>(kAlphabet[v]);
        table[upper] = static_cast<int8_t>(v);
        if (upper >= 'A' && upper <= 'Z') {
            table[upper - 'A' + 'a'] = static_cast<int8_t>(v);
        }
    }
    // Look-alikes
    table['O'] = 0;
    table['o'] = 0;
    table['I'] = 1;
    table['i'] = 1;
    table['L'] = 1;
    table['l'] = 1;
    return table;
}

static constexpr std::array<int8_t, 256> kDecode = make_decode_table();

static_assert(kDecode['U'] == -1 && kDecode['u'] == -1, "U is not a Crockford digit");
static_assert(kDecode['Z'] == 31 && kDecode['z'] == 31, "Z is the last digit");

int symbol_value(char c) {
    return kDecode[static_cast<unsigned char>(c)];
}

// ---- Encode ----

template<typename U>
static void append_digits(U value, std::size_t count, std::string& out) {
    constexpr std::size_t bits = sizeof(U) * 8;
    out.reserve(out.size() + count);
    for (std::size_t i = 0; i < count; ++i) {
        std::size_t shift = (count - i - 1) * kBitsPerChar;
        unsigned index = 0;
        if (shift < bits) {
            index = static_cast<unsigned>((value >> shift) & 0x1F);
        }
        out += kAlphabet[index];
    }
}

void append_u64(uint64_t value, std::size_t count, std::string& out) {
    append_digits(value, count, out);
}

void append_u128(u128 value, std::size_t count, std::string& out) {
    append_digits(value, count, out);
}

std::string encode_u64(uint64_t value, std::size_t count) {
    std::string out;
    append_u64(value, count, out);
    return out;
}

std::string encode_u128(u128 value, std::size_t count) {
    std::string out;
    append_u128(value, count, out);
    return out;
}

// ---- Decode ----

// `lead_cap` bounds the first symbol of a full-width string; the remaining
// digits are guarded by the generic shift-overflow check.
template<typename U>
static Result<U> parse_digits(std::string_view input, std::size_t expected_chars,
                              std::size_t max_chars, int lead_cap) {
    if (expected_chars > max_chars || input.size() != expected_chars) {
        return UlidError::invalid_length(input.size(), expected_chars);
    }

    constexpr U headroom = static_cast<U>(~U(0)) >> kBitsPerChar;

    U result = 0;
    for (std::size_t i = 0; i < input.size(); ++i) {
        int v = symbol_value(input[i]);
        if (v < 0) {
            return UlidError::invalid_char(input[i], i);
        }
        if (i == 0 && expected_chars == max_chars && v > lead_cap) {
            return UlidError::overflow();
        }
        if (result > headroom) {
            return UlidError::overflow();
        }
        result = static_cast<U>((result << kBitsPerChar) | static_cast<U>(v));
    }
    return Result<U>::ok(result);
}

Result<uint64_t> parse_u64(std::string_view input, std::size_t expected_chars) {
    // 13 digits carry 65 bits; the historical format only ever accepted a
    // leading digit up to 7 here.
    return parse_digits<uint64_t>(input, expected_chars, kU64Chars, 7);
}

Result<u128> parse_u128(std::string_view input, std::size_t expected_chars) {
    // 26 digits carry 130 bits, so the leading digit holds at most 3 bits.
    return parse_digits<u128>(input, expected_chars, kU128Chars, 7);
}

} // namespace ulidkit::crockford
