#ifndef __GA_HPP_
#define __GA_HPP_

#include <algorithm>
#include <cctype>
#include <charconv>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <expected>
#include <format>
#include <initializer_list>
#include <limits>
#include <new>
#include <optional>
#include <print>
#include <source_location>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

// -----------------------------------------------------------------------------
// CONFIGURATION & MACROS
// -----------------------------------------------------------------------------

#ifndef GA_DEBUG_LEVEL
    #define GA_DEBUG_LEVEL 0
#endif

#define GA_DEBUG_L1(fmt, ...) do { if constexpr (GA_DEBUG_LEVEL >= 1) std::println(stderr, "[GA_DBG: L1]: {}", std::format(fmt __VA_OPT__(,) __VA_ARGS__)); } while(0)
#define GA_DEBUG_L2(fmt, ...) do { if constexpr (GA_DEBUG_LEVEL >= 2) std::println(stderr, "[GA_DBG: L2]: {}", std::format(fmt __VA_OPT__(,) __VA_ARGS__)); } while(0)
#define GA_DEBUG_L3(fmt, ...) do { if constexpr (GA_DEBUG_LEVEL >= 3) std::println(stderr, "[GA_DBG: L3]: {}", std::format(fmt __VA_OPT__(,) __VA_ARGS__)); } while(0)

#define GA_ASSERT(expr, fmt, ...) \
    do {\
        if (!(expr)) {\
            std::println(stderr, "{}:{}: [\033[1;31mFATAL\033[0m]: {}",__FILE_NAME__, __LINE__, std::format(fmt __VA_OPT__(,) __VA_ARGS__));\
            std::exit(EXIT_FAILURE);\
        }\
    } while(false)

#define GA_ASSERT_LOC(loc, expr, fmt, ...) \
    do {\
        if (!(expr)) {\
            std::println(stderr, "{}:{}: [\033[1;31mFATAL\033[0m]: {}", loc.file_name(), loc.line(), std::format(fmt __VA_OPT__(,) __VA_ARGS__));\
            std::exit(EXIT_FAILURE);\
        }\
    } while(false)

namespace ga {

// -----------------------------------------------------------------------------
// UTILITIES & CONCEPTS
// -----------------------------------------------------------------------------

// Option and slot identities are chosen by the utility, usually an enum class.
template<typename T>
concept Identity_C = std::is_enum_v<T> || std::integral<T>;

// Types an event's raw value can be converted to.
template<typename T>
concept Convertible_C = std::is_same_v<T, bool> || std::integral<T> || std::floating_point<T> || std::is_same_v<T, std::string>;

inline constexpr std::size_t unbounded = std::numeric_limits<std::size_t>::max();

[[nodiscard]]
inline bool is_digit(char c) noexcept { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

// Bytes in the UTF-8 sequence starting at s[i], clamped to the end of s.
[[nodiscard]]
inline auto utf8_width(std::string_view s, std::size_t i) noexcept -> std::size_t
{
    const auto lead = static_cast<unsigned char>(s[i]);
    std::size_t n = lead >= 0xF0 ? 4 : lead >= 0xE0 ? 3 : lead >= 0xC0 ? 2 : 1;
    return std::min(n, s.size() - i);
}

// -----------------------------------------------------------------------------
// MEMORY MANAGEMENT
// -----------------------------------------------------------------------------

// Interns option strings so the lookup tables can key on string_view.
// Blocks never move, so views stay valid when the arena itself is moved.
class Arena
{
    struct Block
    {
        char* data;
        char* cur;
        char* end;
    };
    std::size_t block_size_;
    std::vector<Block> blocks_;

public:
    explicit Arena(std::size_t block_size = 4 * 1024) : block_size_(block_size)
    {
        GA_DEBUG_L3("Arena: Initializing with block size {}", block_size);
    }

    Arena(const Arena&) = delete;
    Arena& operator=(const Arena&) = delete;

    Arena(Arena&& other) noexcept : block_size_(other.block_size_), blocks_(std::move(other.blocks_))
    {
        other.blocks_.clear();
    }

    Arena& operator=(Arena&& other) noexcept
    {
        if (this != &other)
        {
            release();
            block_size_ = other.block_size_;
            blocks_ = std::move(other.blocks_);
            other.blocks_.clear();
        }
        return *this;
    }

    ~Arena()
    {
        GA_DEBUG_L3("Arena: Releasing {} block(s)", blocks_.size());
        release();
    }

    [[nodiscard]]
    std::string_view str(std::string_view s)
    {
        if (s.empty()) return {};
        char* mem = alloc(s.size() + 1);
        std::memcpy(mem, s.data(), s.size());
        mem[s.size()] = '\0';
        return { mem, s.size() };
    }

    [[nodiscard]]
    std::size_t blocks() const noexcept { return blocks_.size(); }

private:
    char* alloc(std::size_t n)
    {
        if (blocks_.empty() || blocks_.back().cur + n > blocks_.back().end)
        {
            GA_DEBUG_L3("Arena: Block full. Allocating new block for request of {} bytes", n);
            add_block(std::max(block_size_, n));
        }
        Block& b = blocks_.back();
        char* p = b.cur;
        b.cur += n;
        return p;
    }

    void add_block(std::size_t size)
    {
        char* mem = static_cast<char*>(::operator new(size));
        blocks_.push_back(Block{ mem, mem, mem + size });
    }

    void release() noexcept
    {
        for (auto& b : blocks_) ::operator delete(b.data);
        blocks_.clear();
    }
};

// -----------------------------------------------------------------------------
// ERRORS
// -----------------------------------------------------------------------------

enum class Error_kind : uint8_t
{
    Unknown_option,
    Ambiguous_option,
    Ambiguous_value,
    Missing_required_value,
    Unexpected_value,
    Invalid_value,
    Missing_operand,
    Excess_operand,
};

// One fatal parse failure. `option` is the spelling as written (or the slot
// name for operand errors), `value` the offending raw text.
struct Error
{
    Error_kind kind;
    std::string option{};
    std::string value{};
    std::vector<std::string> candidates{};
    std::string reason{};
};

[[nodiscard]]
constexpr auto name_of(Error_kind k) -> std::string_view
{
    switch (k)
    {
        case Error_kind::Unknown_option:         return "Unknown_option";
        case Error_kind::Ambiguous_option:       return "Ambiguous_option";
        case Error_kind::Ambiguous_value:        return "Ambiguous_value";
        case Error_kind::Missing_required_value: return "Missing_required_value";
        case Error_kind::Unexpected_value:       return "Unexpected_value";
        case Error_kind::Invalid_value:          return "Invalid_value";
        case Error_kind::Missing_operand:        return "Missing_operand";
        case Error_kind::Excess_operand:         return "Excess_operand";
    }
    return "unknown";
}

// -----------------------------------------------------------------------------
// SPEC MODEL: SPELLINGS & OPTIONS
// -----------------------------------------------------------------------------

enum class Value_arity : uint8_t { None, Required, Optional };

[[nodiscard]]
constexpr auto name_of(Value_arity a) -> std::string_view
{
    switch (a)
    {
        case Value_arity::None:     return "None";
        case Value_arity::Required: return "Required";
        case Value_arity::Optional: return "Optional";
    }
    return "unknown";
}

// One textual form of an option. Long names are stored without the leading
// "--"; a hidden spelling keeps its third hyphen as part of the name.
struct Spelling
{
    std::string_view name;
    bool is_short = false;
    Value_arity arity = Value_arity::None;
    std::string_view meta{};

    [[nodiscard]] bool hidden() const noexcept { return !is_short && name.starts_with('-'); }
    [[nodiscard]] bool takes_value() const noexcept { return arity != Value_arity::None; }

    [[nodiscard]]
    auto text() const -> std::string
    {
        return is_short ? std::format("-{}", name) : std::format("--{}", name);
    }
};

// Parses a declaration such as "-c NUM", "-p[DIR]", "--bytes=NUM",
// "--color[=WHEN]" or "---presume-input-pipe". The returned views point into
// `decl`.
[[nodiscard]]
inline auto parse_spelling(std::string_view decl) -> std::expected<Spelling, std::string>
{
    Spelling sp;
    constexpr auto npos = std::string_view::npos;

    if (decl.starts_with("--"))
    {
        std::string_view body = decl.substr(2);
        if (auto br = body.find("[="); br != npos)
        {
            if (!body.ends_with(']'))
                return std::unexpected(std::format("Unterminated optional value in '{}'", decl));
            sp.meta = body.substr(br + 2, body.size() - br - 3);
            sp.arity = Value_arity::Optional;
            body = body.substr(0, br);
        }
        else if (auto eq = body.find('='); eq != npos)
        {
            sp.meta = body.substr(eq + 1);
            sp.arity = Value_arity::Required;
            body = body.substr(0, eq);
        }

        if (body.empty() || body == "-")
            return std::unexpected(std::format("Long option '{}' has no name", decl));
        if (body.find_first_of(" []=") != npos)
            return std::unexpected(std::format("Invalid character in long option '{}'", decl));
        if (sp.takes_value() && sp.meta.empty())
            return std::unexpected(std::format("Missing value name in '{}'", decl));

        sp.name = body;
        return sp;
    }

    if (decl.size() >= 2 && decl[0] == '-')
    {
        char c = decl[1];
        if (!std::isgraph(static_cast<unsigned char>(c)) || c == '-')
            return std::unexpected(std::format("Invalid short option character in '{}'", decl));

        sp.is_short = true;
        sp.name = decl.substr(1, 1);

        std::string_view rest = decl.substr(2);
        if (rest.empty()) return sp;

        if (rest.starts_with(' '))
        {
            sp.meta = rest.substr(1);
            sp.arity = Value_arity::Required;
        }
        else if (rest.starts_with('[') && rest.ends_with(']'))
        {
            sp.meta = rest.substr(1, rest.size() - 2);
            sp.arity = Value_arity::Optional;
        }
        else
        {
            return std::unexpected(std::format("Exactly one character must follow '-' in '{}'", decl));
        }

        if (sp.meta.empty())
            return std::unexpected(std::format("Missing value name in '{}'", decl));
        return sp;
    }

    return std::unexpected(std::format("Spelling '{}' must start with '-' or '--'", decl));
}

inline constexpr uint16_t O_STOP = 1 << 0;   // ends the parse when matched (--help, --version)

template <typename Id>
requires Identity_C<Id>
struct Opt
{
    Id id;
    std::vector<std::string> spellings;
    std::string desc{};
    std::optional<std::string> implied_{};
    std::vector<std::pair<std::string, std::string>> values_{};
    uint16_t flags_ = 0;

    auto flags(uint16_t f) -> Opt&
    {
        flags_ |= f;
        return *this;
    }

    auto stop() -> Opt& { return flags(O_STOP); }

    // Value carried by the event when the spelling supplies none.
    auto implied(std::string v) -> Opt&
    {
        implied_ = std::move(v);
        return *this;
    }

    // One accepted member and the extra keys that select it.
    auto value(const std::string& canonical, std::initializer_list<std::string_view> aliases = {}) -> Opt&
    {
        values_.emplace_back(canonical, canonical);
        for (auto a : aliases) values_.emplace_back(std::string(a), canonical);
        return *this;
    }

    auto values(std::initializer_list<std::string_view> members) -> Opt&
    {
        for (auto m : members) values_.emplace_back(std::string(m), std::string(m));
        return *this;
    }
};

// -----------------------------------------------------------------------------
// SPEC MODEL: POSITIONALS
// -----------------------------------------------------------------------------

struct Arity
{
    std::size_t min = 1;
    std::size_t max = 1;

    [[nodiscard]] constexpr bool bounded() const noexcept { return max != unbounded; }
    [[nodiscard]] constexpr bool fixed() const noexcept { return min == max; }
};

[[nodiscard]] constexpr auto exactly(std::size_t n) -> Arity { return { n, n }; }
[[nodiscard]] constexpr auto range(std::size_t lo, std::size_t hi) -> Arity { return { lo, hi }; }
[[nodiscard]] constexpr auto at_least(std::size_t n) -> Arity { return { n, unbounded }; }

template <typename Id>
requires Identity_C<Id>
struct Slot
{
    Id id;
    std::string name;
    Arity arity = exactly(1);
    bool greedy = false;   // captures everything from its first token on, verbatim
};

template <typename Id>
requires Identity_C<Id>
class Positional_spec
{
    std::vector<Slot<Id>> slots_;

public:
    Positional_spec() = default;
    Positional_spec(std::initializer_list<Slot<Id>> slots) : slots_(slots) {}

    auto add(Slot<Id> slot) -> Positional_spec&
    {
        slots_.push_back(std::move(slot));
        return *this;
    }

    [[nodiscard]] auto slots() const -> std::span<const Slot<Id>> { return slots_; }

    [[nodiscard]]
    auto validate() const -> std::expected<void, std::string>
    {
        std::optional<std::size_t> open;
        for (std::size_t i = 0; i < slots_.size(); ++i)
        {
            const auto& s = slots_[i];
            if (s.arity.min > s.arity.max)
                return std::unexpected(std::format("Slot '{}' has a minimum above its maximum", s.name));
            if (s.arity.max == 0)
                return std::unexpected(std::format("Slot '{}' can never hold an operand", s.name));

            if (s.greedy)
            {
                if (i + 1 != slots_.size())
                    return std::unexpected(std::format("Greedy slot '{}' must be the last slot", s.name));
                if (s.arity.bounded())
                    return std::unexpected(std::format("Greedy slot '{}' must be unbounded", s.name));
                for (std::size_t j = 0; j < i; ++j)
                    if (!slots_[j].arity.fixed())
                        return std::unexpected(std::format("Slot '{}' before greedy slot '{}' must have a fixed count", slots_[j].name, s.name));
            }

            if (!s.arity.bounded())
            {
                if (open)
                    return std::unexpected(std::format("Slots '{}' and '{}' are both unbounded with no fixed slot between them", slots_[*open].name, s.name));
                open = i;
            }
            else if (s.arity.fixed())
            {
                open.reset();
            }
        }
        return {};
    }

    // Number of operands that precede the greedy slot, if there is one.
    [[nodiscard]]
    auto greedy_offset() const -> std::optional<std::size_t>
    {
        if (slots_.empty() || !slots_.back().greedy) return std::nullopt;
        std::size_t n = 0;
        for (std::size_t i = 0; i + 1 < slots_.size(); ++i) n += slots_[i].arity.min;
        return n;
    }
};

// -----------------------------------------------------------------------------
// SPEC MODEL: DEPRECATED NUMERIC SHORTHAND & CONFIG
// -----------------------------------------------------------------------------

// "+N" / "-N" forms (head, tail). The payload after the sign becomes the
// bound option's value.
template <typename Id>
requires Identity_C<Id>
struct Numeric_binding
{
    char sign;
    Id id;
    std::string suffixes{};      // letters accepted after the digits, e.g. "bclf"
    bool leading_only = false;   // only as the very first argument
};

enum class Numeric_precedence : uint8_t { Short_first, Numeric_first };

struct Parser_config
{
    bool permute = true;   // options may follow operands
    Numeric_precedence numeric = Numeric_precedence::Short_first;
};

// -----------------------------------------------------------------------------
// TOKENIZER
// -----------------------------------------------------------------------------

enum class Token_kind : uint8_t { Short_cluster, Long_option, Free_value, Terminator, Deprecated_numeric };

[[nodiscard]]
constexpr auto name_of(Token_kind k) -> std::string_view
{
    switch (k)
    {
        case Token_kind::Short_cluster:      return "Short_cluster";
        case Token_kind::Long_option:        return "Long_option";
        case Token_kind::Free_value:         return "Free_value";
        case Token_kind::Terminator:         return "Terminator";
        case Token_kind::Deprecated_numeric: return "Deprecated_numeric";
    }
    return "unknown";
}

struct Token
{
    Token_kind kind;
    std::string_view text{};                        // the whole argument
    std::string_view body{};                        // cluster chars, long name, free value or numeric payload
    std::optional<std::string_view> inline_value{}; // "--name=value"
    char sign = 0;                                  // Deprecated_numeric only
};

struct Numeric_form
{
    char sign;
    std::string_view suffixes{};
    bool leading_only = false;
};

// What the tokenizer needs to know about a utility.
struct Lex_rules
{
    std::string_view shorts{};
    std::string_view value_shorts{};   // shorts whose spelling takes a value
    std::vector<Numeric_form> numerics{};
    bool numeric_first = false;
};

class Tokenizer
{
    std::span<const std::string_view> args_;
    std::size_t cur_ = 0;
    bool terminated_ = false;
    Lex_rules rules_;

public:
    explicit Tokenizer(std::span<const std::string_view> args, Lex_rules rules = {})
    : args_(args), rules_(std::move(rules))
    {}

    [[nodiscard]] bool empty() const noexcept { return cur_ >= args_.size(); }

    auto next() -> std::optional<Token>;

    // The next argument, unclassified. Used for option values.
    auto take_raw() -> std::optional<std::string_view>
    {
        if (empty()) return std::nullopt;
        return args_[cur_++];
    }

    // Everything left, verbatim.
    auto drain() -> std::vector<std::string_view>
    {
        std::vector<std::string_view> rest(args_.begin() + static_cast<std::ptrdiff_t>(cur_), args_.end());
        cur_ = args_.size();
        return rest;
    }

    // Treat every later argument as a free value.
    void stop_options() noexcept { terminated_ = true; }

private:
    [[nodiscard]] auto numeric_form(std::string_view arg, bool leading) const -> const Numeric_form*;
    [[nodiscard]] bool explains_cluster(std::string_view chars) const;
};

// -----------------------------------------------------------------------------
// PREFIX RESOLVER
// -----------------------------------------------------------------------------

enum class Match_kind : uint8_t { Exact, Unique_prefix, Ambiguous, No_match };

struct Resolution
{
    Match_kind kind = Match_kind::No_match;
    std::string_view name{};
    std::vector<std::string_view> candidates{};

    [[nodiscard]]
    explicit operator bool() const noexcept { return kind == Match_kind::Exact || kind == Match_kind::Unique_prefix; }
};

// An exact match wins even when it is also a prefix of other names.
[[nodiscard]]
inline auto resolve(std::string_view candidate, std::span<const std::string_view> names) -> Resolution
{
    Resolution r;
    for (auto n : names)
    {
        if (n == candidate) return Resolution{ .kind = Match_kind::Exact, .name = n, .candidates = {} };
        if (n.starts_with(candidate)) r.candidates.push_back(n);
    }

    if (r.candidates.size() == 1)
    {
        r.kind = Match_kind::Unique_prefix;
        r.name = r.candidates.front();
        r.candidates.clear();
    }
    else if (r.candidates.size() > 1)
    {
        r.kind = Match_kind::Ambiguous;
    }
    return r;
}

// -----------------------------------------------------------------------------
// EVENTS
// -----------------------------------------------------------------------------

enum class Arg_source : uint8_t { Option, Positional };

template <typename Id>
requires Identity_C<Id>
struct Arg_event
{
    Id id;
    Arg_source source = Arg_source::Option;
    std::string spelling{};               // "--bytes", "-c", "-20" or the slot name
    std::optional<std::string> value{};   // raw, unconverted
    std::vector<std::string> captured{};  // greedy slot only

    bool operator==(const Arg_event&) const = default;
};

struct Operand
{
    std::string text;
    std::size_t at;   // number of option events emitted before it
};

template <typename Id>
requires Identity_C<Id>
struct Match_result
{
    std::vector<Arg_event<Id>> events;
    std::vector<Operand> operands;
    std::vector<std::string> trailing;   // greedy capture
    bool stopped = false;                // a stop option ended the parse
};

// -----------------------------------------------------------------------------
// SPEC
// -----------------------------------------------------------------------------

template <typename Id>
requires Identity_C<Id>
class Spec
{
public:
    struct Option
    {
        Id id;
        std::vector<Spelling> spellings;
        std::vector<std::pair<std::string_view, std::string_view>> values;   // key -> member
        std::optional<std::string_view> implied;
        uint16_t flags;
        std::string_view desc;

        [[nodiscard]] bool enumerated() const noexcept { return !values.empty(); }
    };

    struct Hit
    {
        const Option* option;
        const Spelling* spelling;
    };

private:
    struct Spelling_ref
    {
        std::size_t option;
        std::size_t spelling;
    };

    Arena arena_;
    std::string name_;
    std::vector<Option> options_;
    std::unordered_map<std::string_view, Spelling_ref> long_index_;
    std::unordered_map<char, Spelling_ref> short_index_;
    std::vector<std::string_view> long_names_;
    std::string short_chars_;
    std::string value_chars_;
    Positional_spec<Id> positionals_;
    std::vector<Numeric_binding<Id>> numerics_;

public:
    Parser_config cfg_;

    explicit Spec(std::string name = "", std::size_t reserve = 16)
    : arena_(), name_(std::move(name))
    {
        options_.reserve(reserve);
        long_index_.reserve(reserve);
        long_names_.reserve(reserve);
    }

    auto add(Opt<Id> opt, std::source_location loc = std::source_location::current()) -> Spec&;

    auto positional(Slot<Id> slot, std::source_location loc = std::source_location::current()) -> Spec&
    {
        GA_DEBUG_L1("Add: Positional slot '{}' [{}, {}]", slot.name, slot.arity.min, slot.arity.max);
        positionals_.add(std::move(slot));
        auto ok = positionals_.validate();
        GA_ASSERT_LOC(loc, ok.has_value(), "{}", ok.error());
        return *this;
    }

    auto numeric(Numeric_binding<Id> b, std::source_location loc = std::source_location::current()) -> Spec&
    {
        GA_ASSERT_LOC(loc, (b.sign == '-' || b.sign == '+'), "Numeric shorthand sign must be '-' or '+', got '{}'", b.sign);
        GA_ASSERT_LOC(loc, find_numeric(b.sign) == nullptr, "Duplicate numeric shorthand for '{}'", b.sign);
        GA_ASSERT_LOC(loc, std::ranges::none_of(b.suffixes, is_digit), "Numeric shorthand suffixes cannot be digits");
        GA_DEBUG_L1("Add: Numeric shorthand '{}N' (suffixes '{}')", b.sign, b.suffixes);
        numerics_.push_back(std::move(b));
        return *this;
    }

    [[nodiscard]] auto name() const -> std::string_view { return name_; }
    [[nodiscard]] auto options() const -> std::span<const Option> { return options_; }
    [[nodiscard]] auto positionals() const -> const Positional_spec<Id>& { return positionals_; }
    [[nodiscard]] auto long_names() const -> std::span<const std::string_view> { return long_names_; }

    [[nodiscard]]
    auto visible_long_names() const -> std::vector<std::string_view>
    {
        std::vector<std::string_view> out;
        for (auto n : long_names_)
            if (!n.starts_with('-')) out.push_back(n);
        return out;
    }

    [[nodiscard]]
    auto find_short(char c) const -> std::optional<Hit>
    {
        if (auto it = short_index_.find(c); it != short_index_.end()) return hit(it->second);
        return std::nullopt;
    }

    [[nodiscard]]
    auto find_long(std::string_view name) const -> std::optional<Hit>
    {
        if (auto it = long_index_.find(name); it != long_index_.end()) return hit(it->second);
        return std::nullopt;
    }

    [[nodiscard]]
    auto find_numeric(char sign) const -> const Numeric_binding<Id>*
    {
        for (const auto& b : numerics_)
            if (b.sign == sign) return &b;
        return nullptr;
    }

    [[nodiscard]]
    auto lex_rules() const -> Lex_rules
    {
        Lex_rules r{ .shorts = short_chars_, .value_shorts = value_chars_, .numerics = {}, .numeric_first = cfg_.numeric == Numeric_precedence::Numeric_first };
        for (const auto& b : numerics_)
            r.numerics.push_back(Numeric_form{ .sign = b.sign, .suffixes = b.suffixes, .leading_only = b.leading_only });
        return r;
    }

private:
    [[nodiscard]]
    auto hit(Spelling_ref ref) const -> Hit
    {
        const Option& o = options_[ref.option];
        return Hit{ &o, &o.spellings[ref.spelling] };
    }
};

// -----------------------------------------------------------------------------
// OPTION MATCHER
// -----------------------------------------------------------------------------

template <typename Id>
requires Identity_C<Id>
class Matcher
{
    using Option = typename Spec<Id>::Option;

    const Spec<Id>& spec_;
    Tokenizer toks_;
    Match_result<Id> out_;
    std::optional<std::size_t> greedy_at_;
    bool done_ = false;

public:
    // greedy_at: operand index where the greedy capture starts, from the layout in use.
    Matcher(const Spec<Id>& spec, std::span<const std::string_view> args, std::optional<std::size_t> greedy_at)
    : spec_(spec), toks_(args, spec.lex_rules()), out_(), greedy_at_(greedy_at)
    {}

    [[nodiscard]] bool done() const noexcept { return done_; }

    // Consumes one token (plus the value it takes, if any).
    auto step() -> std::expected<void, Error>;
    auto run() -> std::expected<Match_result<Id>, Error>;

private:
    auto match_short(const Token& tok) -> std::expected<void, Error>;
    auto match_long(const Token& tok) -> std::expected<void, Error>;
    auto match_numeric(const Token& tok) -> std::expected<void, Error>;
    auto take_operand(std::string_view text) -> std::expected<void, Error>;
    auto attach(const Option& o, const Spelling& sp, std::string_view raw) -> std::expected<void, Error>;
    auto match_value(const Option& o, const Spelling& sp, std::string_view raw) const -> std::expected<std::string_view, Error>;
    void emit(const Option& o, const Spelling& sp, std::optional<std::string_view> value);
};

// -----------------------------------------------------------------------------
// POSITIONAL ALLOCATOR
// -----------------------------------------------------------------------------

// Assigns the collected operands to `layout` and merges the positional events
// back into the option events at the places the operands were seen.
template <typename Id>
requires Identity_C<Id>
[[nodiscard]]
auto allocate(const Positional_spec<Id>& layout, const Match_result<Id>& m) -> std::expected<std::vector<Arg_event<Id>>, Error>;

// -----------------------------------------------------------------------------
// SETTINGS REDUCER
// -----------------------------------------------------------------------------

template <typename S, typename Id>
concept Settings_C = requires(S& s, const Arg_event<Id>& e) { s.apply(e); };

// Later events override earlier ones; `apply` may report conversion failures
// by returning std::expected<void, Error>.
template <typename Id, typename S>
requires Identity_C<Id> && Settings_C<S, Id>
[[nodiscard]]
auto fold(S settings, const std::vector<Arg_event<Id>>& events) -> std::expected<S, Error>
{
    GA_DEBUG_L1("Fold: Applying {} event(s)", events.size());
    for (const auto& e : events)
    {
        using R = decltype(settings.apply(e));
        if constexpr (std::is_void_v<R>)
        {
            settings.apply(e);
        }
        else
        {
            auto r = settings.apply(e);
            if (!r) return std::unexpected(std::move(r.error()));
        }
    }
    return settings;
}

template <typename Dest>
requires Convertible_C<Dest>
[[nodiscard]]
auto convert(std::string_view s) -> std::expected<Dest, std::string>
{
    if constexpr (std::is_same_v<Dest, std::string>)
    {
        return std::string(s);
    }
    else if constexpr (std::is_same_v<Dest, bool>)
    {
        if (s == "true" || s == "1" || s == "on" || s == "yes" || s == "y") return true;
        if (s == "false" || s == "0" || s == "off" || s == "no" || s == "n") return false;
        GA_DEBUG_L3("Convert: Failed bool conversion for '{}'", s);
        return std::unexpected(std::format("Invalid boolean value: '{}'", s));
    }
    else
    {
        Dest v{};
        const char* end = s.data() + s.size();
        auto [p, ec] = std::from_chars(s.data(), end, v);
        if (ec == std::errc::result_out_of_range)
            return std::unexpected(std::format("Value too large: '{}'", s));
        if (ec != std::errc{} || p != end || s.empty())
        {
            GA_DEBUG_L3("Convert: Failed numeric conversion for '{}'", s);
            return std::unexpected(std::format("Invalid number: '{}'", s));
        }
        return v;
    }
}

template <typename T, typename Id>
requires Convertible_C<T> && Identity_C<Id>
[[nodiscard]]
auto value_as(const Arg_event<Id>& e) -> std::expected<T, Error>
{
    if (!e.value)
        return std::unexpected(Error{ .kind = Error_kind::Invalid_value, .option = e.spelling, .value = {}, .candidates = {}, .reason = "Missing value" });

    auto r = convert<T>(*e.value);
    if (!r)
        return std::unexpected(Error{ .kind = Error_kind::Invalid_value, .option = e.spelling, .value = *e.value, .candidates = {}, .reason = r.error() });
    return *r;
}

// -----------------------------------------------------------------------------
// PARSER
// -----------------------------------------------------------------------------

template <typename Id>
requires Identity_C<Id>
class Parser
{
    const Spec<Id>& spec_;

public:
    explicit Parser(const Spec<Id>& spec) : spec_(spec) {}

    [[nodiscard]]
    auto match(std::span<const std::string_view> args) const -> std::expected<Match_result<Id>, Error>
    {
        return match(args, spec_.positionals());
    }

    // Greedy capture follows the layout that will allocate the operands.
    [[nodiscard]]
    auto match(std::span<const std::string_view> args, const Positional_spec<Id>& layout) const
        -> std::expected<Match_result<Id>, Error>
    {
        return Matcher<Id>(spec_, args, layout.greedy_offset()).run();
    }

    [[nodiscard]]
    auto events(std::span<const std::string_view> args) const -> std::expected<std::vector<Arg_event<Id>>, Error>
    {
        return events(args, spec_.positionals());
    }

    // Same, with a positional layout chosen by the caller for this invocation.
    [[nodiscard]]
    auto events(std::span<const std::string_view> args, const Positional_spec<Id>& layout) const
        -> std::expected<std::vector<Arg_event<Id>>, Error>
    {
        auto m = match(args, layout);
        if (!m) return std::unexpected(std::move(m.error()));
        if (m->stopped) return std::move(m->events);
        return allocate(layout, *m);
    }

    template <typename S>
    requires Settings_C<S, Id>
    [[nodiscard]]
    auto parse(std::span<const std::string_view> args, S initial = S{}) const -> std::expected<S, Error>
    {
        auto ev = events(args);
        if (!ev) return std::unexpected(std::move(ev.error()));
        return fold(std::move(initial), *ev);
    }

    // argv[0] is the program name and is skipped.
    template <typename S>
    requires Settings_C<S, Id>
    [[nodiscard]]
    auto parse(int argc, char* argv[], S initial = S{}) const -> std::expected<S, Error>
    {
        std::vector<std::string_view> args;
        for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
        return parse<S>(args, std::move(initial));
    }
};

// -----------------------------------------------------------------------------
// IMPLEMENTATION: TOKENIZER
// -----------------------------------------------------------------------------

inline auto Tokenizer::next() -> std::optional<Token>
{
    if (empty()) return std::nullopt;

    bool leading = cur_ == 0;
    std::string_view arg = args_[cur_++];

    if (terminated_)
        return Token{ .kind = Token_kind::Free_value, .text = arg, .body = arg };

    if (arg == "--")
    {
        GA_DEBUG_L2("Lex: '--' ends option scanning");
        terminated_ = true;
        return Token{ .kind = Token_kind::Terminator, .text = arg };
    }

    if (arg.starts_with("--"))
    {
        std::string_view body = arg.substr(2);
        std::optional<std::string_view> inline_value;
        if (auto eq = body.find('='); eq != std::string_view::npos)
        {
            inline_value = body.substr(eq + 1);
            body = body.substr(0, eq);
        }
        return Token{ .kind = Token_kind::Long_option, .text = arg, .body = body, .inline_value = inline_value };
    }

    if (arg.size() > 1 && arg[0] == '-')
    {
        if (is_digit(arg[1]))
        {
            bool is_cluster = explains_cluster(arg.substr(1));
            if (const auto* form = numeric_form(arg, leading); form && (!is_cluster || rules_.numeric_first))
            {
                GA_DEBUG_L2("Lex: '{}' is a numeric shorthand", arg);
                return Token{ .kind = Token_kind::Deprecated_numeric, .text = arg, .body = arg.substr(1), .sign = '-' };
            }
            // A declared leading short makes it a cluster; the matcher reports what follows.
            if (!is_cluster && rules_.shorts.find(arg[1]) == std::string_view::npos)
                return Token{ .kind = Token_kind::Free_value, .text = arg, .body = arg };
        }
        return Token{ .kind = Token_kind::Short_cluster, .text = arg, .body = arg.substr(1) };
    }

    if (numeric_form(arg, leading))
    {
        GA_DEBUG_L2("Lex: '{}' is a numeric shorthand", arg);
        return Token{ .kind = Token_kind::Deprecated_numeric, .text = arg, .body = arg.substr(1), .sign = arg[0] };
    }

    return Token{ .kind = Token_kind::Free_value, .text = arg, .body = arg };
}

inline auto Tokenizer::numeric_form(std::string_view arg, bool leading) const -> const Numeric_form*
{
    if (arg.size() < 2) return nullptr;

    for (const auto& f : rules_.numerics)
    {
        if (arg[0] != f.sign || (f.leading_only && !leading)) continue;

        std::size_t i = 1;
        while (i < arg.size() && is_digit(arg[i])) ++i;
        if (i == 1) return nullptr;

        for (; i < arg.size(); ++i)
            if (f.suffixes.find(arg[i]) == std::string_view::npos) return nullptr;
        return &f;
    }
    return nullptr;
}

// Walks the cluster as the matcher would: a value-taking short swallows the rest.
inline bool Tokenizer::explains_cluster(std::string_view chars) const
{
    for (char c : chars)
    {
        if (rules_.shorts.find(c) == std::string_view::npos) return false;
        if (rules_.value_shorts.find(c) != std::string_view::npos) return true;
    }
    return true;
}

// -----------------------------------------------------------------------------
// IMPLEMENTATION: SPEC::ADD
// -----------------------------------------------------------------------------

template <typename Id>
requires Identity_C<Id>
auto Spec<Id>::add(Opt<Id> opt, std::source_location loc) -> Spec&
{
    GA_DEBUG_L1("Add: Registering option with {} spelling(s)", opt.spellings.size());
    GA_ASSERT_LOC(loc, !opt.spellings.empty(), "{}", "Option must declare at least one spelling");

    Option o{
        .id = opt.id,
        .spellings = {},
        .values = {},
        .implied = std::nullopt,
        .flags = opt.flags_,
        .desc = arena_.str(opt.desc),
    };
    if (opt.implied_) o.implied = arena_.str(*opt.implied_);

    for (const auto& [key, member] : opt.values_)
    {
        GA_ASSERT_LOC(loc, !key.empty(), "{}", "Enumerated value keys cannot be empty");
        bool dup = std::ranges::any_of(o.values, [&](const auto& kv) { return kv.first == key; });
        GA_ASSERT_LOC(loc, !dup, "Duplicate enumerated value '{}'", key);
        o.values.emplace_back(arena_.str(key), arena_.str(member));
    }

    const std::size_t index = options_.size();
    bool takes_value = false;

    // 1. Register spellings
    for (const auto& decl : opt.spellings)
    {
        auto parsed = parse_spelling(arena_.str(decl));
        GA_ASSERT_LOC(loc, parsed.has_value(), "{}", parsed.error());
        const Spelling& sp = *parsed;
        const Spelling_ref ref{ index, o.spellings.size() };

        if (sp.is_short)
        {
            char c = sp.name[0];
            GA_ASSERT_LOC(loc, !short_index_.contains(c), "Duplicate option: -{}", c);
            short_index_.emplace(c, ref);
            short_chars_ += c;
            if (sp.takes_value()) value_chars_ += c;
        }
        else
        {
            GA_ASSERT_LOC(loc, !long_index_.contains(sp.name), "Duplicate option: --{}", sp.name);
            long_index_.emplace(sp.name, ref);
            long_names_.push_back(sp.name);
        }

        GA_DEBUG_L2("  -> Mapped '{}' (arity {}) to option #{}", sp.text(), name_of(sp.arity), index);
        takes_value = takes_value || sp.takes_value();
        o.spellings.push_back(sp);
    }

    // 2. Enumerated values need a way in, and an implied value must be a member
    if (o.enumerated())
    {
        GA_ASSERT_LOC(loc, takes_value, "Option '{}' has enumerated values but no spelling takes a value", o.spellings.front().text());
        if (o.implied)
        {
            bool member = std::ranges::any_of(o.values, [&](const auto& kv) { return kv.second == *o.implied; });
            GA_ASSERT_LOC(loc, member, "Implied value '{}' is not a member of the enumerated set", *o.implied);
        }
    }

    options_.push_back(std::move(o));
    return *this;
}

// -----------------------------------------------------------------------------
// IMPLEMENTATION: MATCHER
// -----------------------------------------------------------------------------

template <typename Id>
requires Identity_C<Id>
auto Matcher<Id>::run() -> std::expected<Match_result<Id>, Error>
{
    GA_DEBUG_L1("Match: Start");
    while (!done_)
    {
        auto r = step();
        if (!r)
        {
            GA_DEBUG_L1("Match: Failed with {}", name_of(r.error().kind));
            return std::unexpected(std::move(r.error()));
        }
    }
    GA_DEBUG_L1("Match: {} event(s), {} operand(s), {} captured", out_.events.size(), out_.operands.size(), out_.trailing.size());
    return std::move(out_);
}

template <typename Id>
requires Identity_C<Id>
auto Matcher<Id>::step() -> std::expected<void, Error>
{
    auto tok = toks_.next();
    if (!tok)
    {
        done_ = true;
        return {};
    }

    GA_DEBUG_L2("Step: {} '{}'", name_of(tok->kind), tok->text);
    switch (tok->kind)
    {
        case Token_kind::Terminator:         return {};
        case Token_kind::Free_value:         return take_operand(tok->text);
        case Token_kind::Long_option:        return match_long(*tok);
        case Token_kind::Short_cluster:      return match_short(*tok);
        case Token_kind::Deprecated_numeric: return match_numeric(*tok);
    }
    return {};
}

template <typename Id>
requires Identity_C<Id>
auto Matcher<Id>::match_short(const Token& tok) -> std::expected<void, Error>
{
    std::string_view body = tok.body;

    for (std::size_t i = 0; i < body.size() && !done_; ++i)
    {
        auto hit = spec_.find_short(body[i]);
        if (!hit)
            return std::unexpected(Error{ .kind = Error_kind::Unknown_option, .option = std::format("-{}", body.substr(i, utf8_width(body, i))) });

        const Option& o = *hit->option;
        const Spelling& sp = *hit->spelling;

        if (!sp.takes_value())
        {
            emit(o, sp, o.implied);
            continue;
        }

        // The rest of the cluster is the value, verbatim.
        std::string_view rest = body.substr(i + 1);
        if (!rest.empty()) return attach(o, sp, rest);

        if (sp.arity == Value_arity::Optional)
        {
            emit(o, sp, o.implied);
            return {};
        }

        auto next = toks_.take_raw();
        if (!next)
            return std::unexpected(Error{ .kind = Error_kind::Missing_required_value, .option = sp.text() });
        GA_DEBUG_L3("     -> Consuming short value arg: '{}'", *next);
        return attach(o, sp, *next);
    }
    return {};
}

template <typename Id>
requires Identity_C<Id>
auto Matcher<Id>::match_long(const Token& tok) -> std::expected<void, Error>
{
    if (tok.body.empty())
        return std::unexpected(Error{ .kind = Error_kind::Unknown_option, .option = std::string(tok.text) });

    auto r = resolve(tok.body, spec_.long_names());
    if (r.kind == Match_kind::No_match)
        return std::unexpected(Error{ .kind = Error_kind::Unknown_option, .option = std::format("--{}", tok.body) });

    if (r.kind == Match_kind::Ambiguous)
    {
        Error e{ .kind = Error_kind::Ambiguous_option, .option = std::format("--{}", tok.body) };
        for (auto c : r.candidates) e.candidates.push_back(std::format("--{}", c));
        return std::unexpected(std::move(e));
    }

    auto hit = *spec_.find_long(r.name);
    const Option& o = *hit.option;
    const Spelling& sp = *hit.spelling;
    GA_DEBUG_L2("  -> Matched long option '{}' as --{}", tok.body, r.name);

    switch (sp.arity)
    {
        case Value_arity::None:
            if (tok.inline_value)
                return std::unexpected(Error{ .kind = Error_kind::Unexpected_value, .option = sp.text(), .value = std::string(*tok.inline_value) });
            emit(o, sp, o.implied);
            return {};

        // A following argument is never taken, it may be an operand.
        case Value_arity::Optional:
            if (tok.inline_value) return attach(o, sp, *tok.inline_value);
            emit(o, sp, o.implied);
            return {};

        case Value_arity::Required:
            if (tok.inline_value) return attach(o, sp, *tok.inline_value);
            if (auto next = toks_.take_raw())
            {
                GA_DEBUG_L3("     -> Consuming value arg: '{}'", *next);
                return attach(o, sp, *next);
            }
            return std::unexpected(Error{ .kind = Error_kind::Missing_required_value, .option = sp.text() });
    }
    return {};
}

template <typename Id>
requires Identity_C<Id>
auto Matcher<Id>::match_numeric(const Token& tok) -> std::expected<void, Error>
{
    const auto* binding = spec_.find_numeric(tok.sign);
    GA_ASSERT(binding != nullptr, "No numeric shorthand bound to '{}'", tok.sign);
    GA_DEBUG_L2("  -> Numeric shorthand '{}' with payload '{}'", tok.text, tok.body);
    out_.events.push_back(Arg_event<Id>{
        .id = binding->id,
        .source = Arg_source::Option,
        .spelling = std::string(tok.text),
        .value = std::string(tok.body),
    });
    return {};
}

template <typename Id>
requires Identity_C<Id>
auto Matcher<Id>::take_operand(std::string_view text) -> std::expected<void, Error>
{
    if (greedy_at_ && out_.operands.size() == *greedy_at_)
    {
        out_.trailing.emplace_back(text);
        for (auto raw : toks_.drain()) out_.trailing.emplace_back(raw);
        GA_DEBUG_L2("  -> Greedy capture of {} argument(s) from '{}'", out_.trailing.size(), text);
        done_ = true;
        return {};
    }

    GA_DEBUG_L3("  -> Storing operand '{}'", text);
    out_.operands.push_back(Operand{ .text = std::string(text), .at = out_.events.size() });
    if (!spec_.cfg_.permute) toks_.stop_options();
    return {};
}

template <typename Id>
requires Identity_C<Id>
auto Matcher<Id>::attach(const Option& o, const Spelling& sp, std::string_view raw) -> std::expected<void, Error>
{
    if (!o.enumerated())
    {
        emit(o, sp, raw);
        return {};
    }

    auto member = match_value(o, sp, raw);
    if (!member) return std::unexpected(std::move(member.error()));
    emit(o, sp, *member);
    return {};
}

template <typename Id>
requires Identity_C<Id>
auto Matcher<Id>::match_value(const Option& o, const Spelling& sp, std::string_view raw) const -> std::expected<std::string_view, Error>
{
    auto invalid = [&] {
        return std::unexpected(Error{ .kind = Error_kind::Invalid_value, .option = sp.text(), .value = std::string(raw) });
    };
    auto member_of = [&](std::string_view key) {
        return std::ranges::find(o.values, key, &std::pair<std::string_view, std::string_view>::first)->second;
    };

    // Short values are taken verbatim: only an exact key is accepted.
    if (sp.is_short)
    {
        for (const auto& [key, member] : o.values)
            if (key == raw) return member;
        return invalid();
    }

    std::vector<std::string_view> keys;
    keys.reserve(o.values.size());
    for (const auto& kv : o.values) keys.push_back(kv.first);

    auto r = resolve(raw, keys);
    GA_DEBUG_L3("     -> Value '{}' resolved as {}", raw, static_cast<int>(r.kind));
    switch (r.kind)
    {
        case Match_kind::Exact:
        case Match_kind::Unique_prefix:
            return member_of(r.name);

        case Match_kind::No_match:
            return invalid();

        case Match_kind::Ambiguous:
        {
            // Several keys of the same member are not ambiguous.
            std::string_view first = member_of(r.candidates.front());
            bool same = std::ranges::all_of(r.candidates, [&](std::string_view c) { return member_of(c) == first; });
            if (same) return first;

            Error e{ .kind = Error_kind::Ambiguous_value, .option = sp.text(), .value = std::string(raw) };
            for (auto c : r.candidates) e.candidates.emplace_back(c);
            return std::unexpected(std::move(e));
        }
    }
    return invalid();
}

template <typename Id>
requires Identity_C<Id>
void Matcher<Id>::emit(const Option& o, const Spelling& sp, std::optional<std::string_view> value)
{
    Arg_event<Id> e{ .id = o.id, .source = Arg_source::Option, .spelling = sp.text() };
    if (value) e.value = std::string(*value);
    out_.events.push_back(std::move(e));

    if (o.flags & O_STOP)
    {
        GA_DEBUG_L2("  -> '{}' stops the parse", sp.text());
        out_.stopped = true;
        done_ = true;
    }
}

// -----------------------------------------------------------------------------
// IMPLEMENTATION: ALLOCATE
// -----------------------------------------------------------------------------

template <typename Id>
requires Identity_C<Id>
auto allocate(const Positional_spec<Id>& layout, const Match_result<Id>& m) -> std::expected<std::vector<Arg_event<Id>>, Error>
{
    auto slots = layout.slots();
    const Slot<Id>* greedy = nullptr;
    if (!slots.empty() && slots.back().greedy)
    {
        greedy = &slots.back();
        slots = slots.first(slots.size() - 1);
    }

    const auto& ops = m.operands;
    const std::size_t n = ops.size();
    GA_DEBUG_L1("Allocate: {} operand(s) over {} slot(s)", n, layout.slots().size());

    auto missing = [&](const Slot<Id>& s, std::size_t pos) {
        Error e{ .kind = Error_kind::Missing_operand, .option = s.name };
        if (pos > 0) e.value = ops[pos - 1].text;
        return std::unexpected(std::move(e));
    };

    // need_after[i]: operands the slots from i on still require
    std::vector<std::size_t> need_after(slots.size() + 1, 0);
    for (std::size_t i = slots.size(); i-- > 0;) need_after[i] = need_after[i + 1] + slots[i].arity.min;

    std::vector<const Slot<Id>*> owner(n, nullptr);
    std::size_t pos = 0;
    for (std::size_t i = 0; i < slots.size(); ++i)
    {
        const auto& s = slots[i];
        const std::size_t avail = n - pos;
        const std::size_t after = need_after[i + 1];
        std::size_t take = 0;

        if (s.arity.bounded())
        {
            if (avail < s.arity.min) return missing(s, pos);
            std::size_t spare = avail > after ? avail - after : 0;
            take = std::min(s.arity.max, std::max(s.arity.min, spare));
        }
        else
        {
            // Leave enough for the slots that follow (sources before a destination).
            if (avail < after + s.arity.min) return missing(s, pos);
            take = avail - after;
        }

        GA_DEBUG_L3("  -> Slot '{}' claims {} operand(s)", s.name, take);
        for (std::size_t k = 0; k < take; ++k) owner[pos++] = &s;
    }

    if (pos < n)
        return std::unexpected(Error{ .kind = Error_kind::Excess_operand, .value = ops[pos].text });

    if (greedy)
    {
        if (m.trailing.size() < greedy->arity.min) return missing(*greedy, pos);
    }
    else if (!m.trailing.empty())
    {
        return std::unexpected(Error{ .kind = Error_kind::Excess_operand, .value = m.trailing.front() });
    }

    std::vector<Arg_event<Id>> out;
    out.reserve(m.events.size() + n + 1);
    std::size_t e = 0;
    for (std::size_t k = 0; k < n; ++k)
    {
        for (; e < ops[k].at && e < m.events.size(); ++e) out.push_back(m.events[e]);
        out.push_back(Arg_event<Id>{
            .id = owner[k]->id,
            .source = Arg_source::Positional,
            .spelling = owner[k]->name,
            .value = ops[k].text,
        });
    }
    for (; e < m.events.size(); ++e) out.push_back(m.events[e]);

    if (greedy && !m.trailing.empty())
    {
        out.push_back(Arg_event<Id>{
            .id = greedy->id,
            .source = Arg_source::Positional,
            .spelling = greedy->name,
            .value = std::nullopt,
            .captured = m.trailing,
        });
    }
    return out;
}

} // namespace ga

// -----------------------------------------------------------------------------
// IMPLEMENTATION: FORMATTERS (Global/std Scope)
// -----------------------------------------------------------------------------

template<>
struct std::formatter<ga::Error_kind> : std::formatter<std::string_view>
{
    auto format(ga::Error_kind k, format_context& ctx) const
    {
        return std::formatter<std::string_view>::format(ga::name_of(k), ctx);
    }
};

// GNU-style one-line diagnostic.
template<>
struct std::formatter<ga::Error> : std::formatter<std::string_view>
{
    auto format(const ga::Error& e, format_context& ctx) const
    {
        const bool is_long = e.option.starts_with("--");
        std::string msg;
        switch (e.kind)
        {
            case ga::Error_kind::Unknown_option:
                msg = is_long ? std::format("unrecognized option '{}'", e.option)
                              : std::format("invalid option -- '{}'", std::string_view(e.option).substr(1));
                break;
            case ga::Error_kind::Ambiguous_option:
                msg = std::format("option '{}' is ambiguous; possibilities:", e.option);
                for (const auto& c : e.candidates) msg += std::format(" '{}'", c);
                break;
            case ga::Error_kind::Ambiguous_value:
                msg = std::format("ambiguous argument '{}' for '{}'", e.value, e.option);
                break;
            case ga::Error_kind::Missing_required_value:
                msg = is_long ? std::format("option '{}' requires an argument", e.option)
                              : std::format("option requires an argument -- '{}'", std::string_view(e.option).substr(1));
                break;
            case ga::Error_kind::Unexpected_value:
                msg = std::format("option '{}' doesn't allow an argument", e.option);
                break;
            case ga::Error_kind::Invalid_value:
                msg = std::format("invalid argument '{}' for '{}'", e.value, e.option);
                break;
            case ga::Error_kind::Missing_operand:
                msg = e.value.empty() ? std::format("missing {} operand", e.option)
                                      : std::format("missing {} operand after '{}'", e.option, e.value);
                break;
            case ga::Error_kind::Excess_operand:
                msg = std::format("extra operand '{}'", e.value);
                break;
        }
        return std::formatter<std::string_view>::format(msg, ctx);
    }
};

#endif // !__GA_HPP_
