#include "blte/espec.hpp"

#include "util/hex.hpp"

#include <cctype>

namespace ngdp::blte {

namespace {

class Parser {
public:
    explicit Parser(std::string_view s) : s_(s) {}

    bool AtEnd() const { return pos_ >= s_.size(); }
    std::size_t Pos() const { return pos_; }

    bool Peek(char c) const { return pos_ < s_.size() && s_[pos_] == c; }

    bool Consume(char c) {
        if (!Peek(c)) return false;
        ++pos_;
        return true;
    }

    bool Consume(std::string_view lit) {
        if (s_.substr(pos_, lit.size()) != lit) return false;
        pos_ += lit.size();
        return true;
    }

    std::string_view Take(std::size_t n) {
        auto out = s_.substr(pos_, n);
        pos_ += out.size();
        return out;
    }

    std::optional<std::uint64_t> Number() {
        const std::size_t start = pos_;
        std::uint64_t v = 0;
        while (pos_ < s_.size() && std::isdigit(static_cast<unsigned char>(s_[pos_]))) {
            v = v * 10 + static_cast<std::uint64_t>(s_[pos_] - '0');
            ++pos_;
        }
        if (pos_ == start) return std::nullopt;
        return v;
    }

    std::expected<ChunkMode, std::string> Mode();
    std::expected<EncodingSpec, std::string> Top();

private:
    std::unexpected<std::string> Error(const std::string& what) const {
        return std::unexpected("espec: " + what + " at offset " + std::to_string(pos_));
    }

    std::expected<ChunkMode, std::string> Zlib();
    std::expected<ChunkMode, std::string> Encrypted();
    std::expected<EncodingSpec, std::string> Blocks();
    std::expected<std::uint64_t, std::string> BlockSize();

    std::string_view s_;
    std::size_t pos_ = 0;
};

std::expected<ChunkMode, std::string> Parser::Zlib() {
    ZlibMode z;
    if (!Consume(':')) return ChunkMode{z};

    if (Consume('{')) {
        auto level = Number();
        if (!level || *level > 9) return Error("bad zlib level");
        if (!Consume(',')) return Error("expected ','");
        z.level = static_cast<int>(*level);
        if (Consume("mpq")) {
            z.window_bits = 0;
        } else {
            auto bits = Number();
            if (!bits || *bits < 9 || *bits > 15) return Error("bad zlib window bits");
            z.window_bits = static_cast<int>(*bits);
        }
        if (!Consume('}')) return Error("expected '}'");
        return ChunkMode{z};
    }

    auto level = Number();
    if (!level || *level > 9) return Error("bad zlib level");
    z.level = static_cast<int>(*level);
    return ChunkMode{z};
}

std::expected<ChunkMode, std::string> Parser::Encrypted() {
    if (!Consume('{')) return Error("expected '{'");

    EncryptedMode e;
    if (!HexDecodeInto(Take(16), e.key_name)) return Error("bad key name");
    if (!Consume(',')) return Error("expected ','");
    if (!HexDecodeInto(Take(8), e.iv)) return Error("bad iv");
    if (!Consume(',')) return Error("expected ','");

    auto inner = Mode();
    if (!inner) return std::unexpected(inner.error());
    if (!Consume('}')) return Error("expected '}'");

    e.inner = std::make_shared<const ChunkMode>(std::move(*inner));
    return ChunkMode{std::move(e)};
}

std::expected<ChunkMode, std::string> Parser::Mode() {
    if (Consume('n')) return ChunkMode::Raw();
    if (Consume('z')) return Zlib();
    if (Consume("e:")) return Encrypted();
    if (Consume("f:{")) {
        auto nested = Top();
        if (!nested) return std::unexpected(nested.error());
        if (!Consume('}')) return Error("expected '}'");
        return ChunkMode::Recursive(std::move(*nested));
    }
    return Error("unknown mode");
}

std::expected<std::uint64_t, std::string> Parser::BlockSize() {
    auto n = Number();
    if (!n) return Error("expected block size");
    if (Consume('K')) return *n << 10;
    if (Consume('M')) return *n << 20;
    return *n;
}

std::expected<EncodingSpec, std::string> Parser::Blocks() {
    EncodingSpec spec;
    const bool braced = Consume('{');

    while (true) {
        BlockSpec block;
        bool is_final = false;

        if (Consume('*')) {
            // "*=mode": everything left as one chunk
            is_final = true;
        } else {
            auto size = BlockSize();
            if (!size) return std::unexpected(size.error());
            if (*size == 0) return Error("zero block size");
            block.size = *size;
            if (Consume('*')) {
                if (auto count = Number()) {
                    if (*count == 0) return Error("zero block count");
                    block.count = *count;
                } else {
                    is_final = true; // "256K*=mode": repeat to the end
                }
            } else {
                block.count = 1;
            }
        }

        if (!Consume('=')) return Error("expected '='");
        auto mode = Mode();
        if (!mode) return std::unexpected(mode.error());
        block.mode = std::move(*mode);
        spec.blocks.push_back(std::move(block));

        if (!braced) break;
        if (Consume('}')) break;
        if (is_final) return Error("greedy block must be last");
        if (!Consume(',')) return Error("expected ',' or '}'");
    }

    spec.mode = spec.blocks.back().mode;
    return spec;
}

std::expected<EncodingSpec, std::string> Parser::Top() {
    if (Consume("b:")) return Blocks();
    auto mode = Mode();
    if (!mode) return std::unexpected(mode.error());
    return EncodingSpec::Single(std::move(*mode));
}

std::string FormatSize(std::uint64_t v) {
    if (v != 0 && (v & 0xfffff) == 0) return std::to_string(v >> 20) + "M";
    if (v != 0 && (v & 0x3ff) == 0) return std::to_string(v >> 10) + "K";
    return std::to_string(v);
}

std::string UpperHex(std::span<const std::uint8_t> b) {
    std::string s = HexEncode(b);
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

} // namespace

std::string FormatChunkMode(const ChunkMode& mode) {
    struct Visitor {
        std::string operator()(const RawMode&) const { return "n"; }
        std::string operator()(const ZlibMode& z) const {
            if (z.window_bits == 0) return "z:{" + std::to_string(z.level) + ",mpq}";
            if (z.window_bits == 15) return z.level == 9 ? "z" : "z:" + std::to_string(z.level);
            return "z:{" + std::to_string(z.level) + "," + std::to_string(z.window_bits) + "}";
        }
        std::string operator()(const EncryptedMode& e) const {
            return "e:{" + UpperHex(e.key_name) + "," + HexEncode(e.iv) + "," +
                   (e.inner ? FormatChunkMode(*e.inner) : std::string("n")) + "}";
        }
        std::string operator()(const RecursiveMode& r) const {
            return "f:{" + (r.nested ? FormatEspec(*r.nested) : std::string("n")) + "}";
        }
    };
    return std::visit(Visitor{}, mode.value);
}

std::string FormatEspec(const EncodingSpec& spec) {
    if (!spec.Chunked()) return FormatChunkMode(spec.mode);

    std::string out = "b:{";
    for (std::size_t i = 0; i < spec.blocks.size(); ++i) {
        const auto& b = spec.blocks[i];
        if (i > 0) out += ",";
        if (b.size == 0 && !b.count) {
            out += "*";
        } else {
            out += FormatSize(b.size);
            if (!b.count) out += "*";
            else if (*b.count != 1) out += "*" + std::to_string(*b.count);
        }
        out += "=" + FormatChunkMode(b.mode);
    }
    return out + "}";
}

std::expected<EncodingSpec, std::string> ParseEspec(std::string_view text) {
    Parser p(text);
    auto spec = p.Top();
    if (!spec) return spec;
    if (!p.AtEnd()) {
        return std::unexpected("espec: trailing characters at offset " + std::to_string(p.Pos()));
    }
    return spec;
}

} // namespace ngdp::blte
