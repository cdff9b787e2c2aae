#include "ga.hpp"
#include <cstdint>
#include <format>
#include <optional>
#include <print>
#include <string>
#include <vector>

// A `tail`-shaped front end: declares the arguments, folds them into a
// settings record and prints what it understood.

enum class Arg
{
    Bytes,
    Lines,
    Shorthand,
    Follow,
    Follow_retry,
    Pid,
    Quiet,
    Retry,
    Sleep,
    Verbose,
    Zero,
    Presume_pipe,
    Help,
    Version,
    File,
};

enum class Mode { Lines, Bytes, Blocks };

struct Settings
{
    Mode mode = Mode::Lines;
    bool from_start = false;   // "+N": count from the beginning
    uint64_t number = 10;
    std::optional<std::string> follow{};
    bool retry = false;
    uint64_t pid = 0;
    double sleep = 1.0;
    bool verbose = false;
    bool zero = false;
    bool presume_pipe = false;
    bool help = false;
    bool version = false;
    std::vector<std::string> files{};

    auto apply(const ga::Arg_event<Arg>& e) -> std::expected<void, ga::Error>
    {
        switch (e.id)
        {
            case Arg::Bytes:
            case Arg::Lines:
            {
                // "+N" counts from the start, as the shorthand does
                std::string_view v = e.value ? std::string_view(*e.value) : std::string_view{};
                bool plus = v.starts_with('+');
                auto n = ga::convert<uint64_t>(plus ? v.substr(1) : v);
                if (!n)
                    return std::unexpected(ga::Error{ .kind = ga::Error_kind::Invalid_value, .option = e.spelling, .value = std::string(v), .candidates = {}, .reason = n.error() });
                mode = e.id == Arg::Bytes ? Mode::Bytes : Mode::Lines;
                from_start = plus;
                number = *n;
                return {};
            }
            case Arg::Shorthand: return apply_shorthand(e);
            case Arg::Follow:       follow = e.value; break;
            case Arg::Follow_retry: follow = "name"; retry = true; break;
            case Arg::Pid:
            {
                auto p = ga::value_as<uint64_t>(e);
                if (!p) return std::unexpected(p.error());
                pid = *p;
                break;
            }
            case Arg::Sleep:
            {
                auto s = ga::value_as<double>(e);
                if (!s) return std::unexpected(s.error());
                sleep = *s;
                break;
            }
            case Arg::Quiet:        verbose = false; break;
            case Arg::Retry:        retry = true; break;
            case Arg::Verbose:      verbose = true; break;
            case Arg::Zero:         zero = true; break;
            case Arg::Presume_pipe: presume_pipe = true; break;
            case Arg::Help:         help = true; break;
            case Arg::Version:      version = true; break;
            case Arg::File:         files.push_back(*e.value); break;
        }
        return {};
    }

private:
    // [+-]NUM[bcl][f]
    auto apply_shorthand(const ga::Arg_event<Arg>& e) -> std::expected<void, ga::Error>
    {
        std::string_view s = *e.value;
        std::size_t digits = 0;
        while (digits < s.size() && ga::is_digit(s[digits])) ++digits;

        auto n = ga::convert<uint64_t>(s.substr(0, digits));
        if (!n)
            return std::unexpected(ga::Error{ .kind = ga::Error_kind::Invalid_value, .option = e.spelling, .value = *e.value, .candidates = {}, .reason = n.error() });

        std::string_view rest = s.substr(digits);
        Mode m = Mode::Lines;
        if (!rest.empty() && rest[0] != 'f')
        {
            m = rest[0] == 'c' ? Mode::Bytes : rest[0] == 'b' ? Mode::Blocks : Mode::Lines;
            rest.remove_prefix(1);
        }
        bool f = rest == "f";
        if (!rest.empty() && !f)
            return std::unexpected(ga::Error{ .kind = ga::Error_kind::Invalid_value, .option = e.spelling, .value = *e.value });

        mode = m;
        number = *n;
        from_start = e.spelling.starts_with('+');
        if (f) follow = "descriptor";
        return {};
    }
};

[[nodiscard]]
constexpr auto name_of(Mode m) -> std::string_view
{
    switch (m)
    {
        case Mode::Lines:  return "lines";
        case Mode::Bytes:  return "bytes";
        case Mode::Blocks: return "blocks";
    }
    return "?";
}

int main(int argc, char *argv[])
{
    // 1. Declare the arguments
    ga::Spec<Arg> spec("tail");
    spec.add({ Arg::Bytes, { "-c NUM", "--bytes=NUM" }, "output the last NUM bytes" })
        .add({ Arg::Lines, { "-n NUM", "--lines=NUM" }, "output the last NUM lines" })
        .add(ga::Opt<Arg>{ Arg::Follow, { "-f", "--follow[=HOW]" }, "output appended data as the file grows" }
                .values({ "descriptor", "name" })
                .implied("descriptor"))
        .add({ Arg::Follow_retry, { "-F" }, "same as --follow=name --retry" })
        .add({ Arg::Pid, { "--pid=PID" }, "with -f, terminate after process ID, PID dies" })
        .add({ Arg::Quiet, { "-q", "--quiet", "--silent" }, "never output headers giving file names" })
        .add({ Arg::Retry, { "--retry" }, "keep trying to open a file if it is inaccessible" })
        .add({ Arg::Sleep, { "-s N", "--sleep-interval=N" }, "with -f, sleep for approximately N seconds" })
        .add({ Arg::Verbose, { "-v", "--verbose" }, "always output headers giving file names" })
        .add({ Arg::Zero, { "-z", "--zero-terminated" }, "line delimiter is NUL, not newline" })
        .add({ Arg::Presume_pipe, { "---presume-input-pipe" } })
        .add(ga::Opt<Arg>{ Arg::Help, { "--help" }, "display this help and exit" }.stop())
        .add(ga::Opt<Arg>{ Arg::Version, { "--version" }, "output version information and exit" }.stop())
        .positional({ .id = Arg::File, .name = "FILE", .arity = ga::at_least(0) })
        .numeric({ .sign = '-', .id = Arg::Shorthand, .suffixes = "bclf", .leading_only = true })
        .numeric({ .sign = '+', .id = Arg::Shorthand, .suffixes = "bclf", .leading_only = true });

    // 2. Parse and fold
    auto result = ga::Parser(spec).parse<Settings>(argc, argv);

    // 3. Report
    if (!result)
    {
        std::println(stderr, "{}: {}", spec.name(), result.error());
        return 1;
    }

    const Settings& s = *result;
    if (s.help)
    {
        std::println("Usage: {} [OPTION]... [FILE]...", spec.name());
        for (const auto& o : spec.options())
        {
            std::string names;
            for (const auto& sp : o.spellings)
            {
                if (sp.hidden()) continue;
                if (!names.empty()) names += ", ";
                names += sp.takes_value() ? std::format("{}{}{}", sp.text(), sp.is_short ? " " : "=", sp.meta) : sp.text();
            }
            if (!names.empty()) std::println("  {:<28} {}", names, o.desc);
        }
        return 0;
    }
    if (s.version)
    {
        std::println("{} (ga) 0.1", spec.name());
        return 0;
    }

    std::println("mode:    {}", name_of(s.mode));
    std::println("number:  {}{}", s.from_start ? "+" : "", s.number);
    std::println("follow:  {}", s.follow.value_or("(none)"));
    std::println("retry:   {}", s.retry);
    std::println("pid:     {}", s.pid);
    std::println("sleep:   {}", s.sleep);
    std::println("verbose: {}", s.verbose);
    std::println("zero:    {}", s.zero);
    std::println("pipe:    {}", s.presume_pipe);

    std::print("files:  ");
    if (s.files.empty()) std::print(" (none)");
    for (const auto& f : s.files) std::print(" '{}'", f);
    std::println("");

    return 0;
}
