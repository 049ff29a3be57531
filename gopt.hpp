#ifndef __GOPT_HPP_
#define __GOPT_HPP_

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <expected>
#include <format>
#include <iostream>
#include <optional>
#include <ostream>
#include <source_location>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

// -----------------------------------------------------------------------------
// CONFIGURATION & MACROS
// -----------------------------------------------------------------------------

#ifndef GOPT_DEBUG_LEVEL
    #define GOPT_DEBUG_LEVEL 0
#endif

#define GOPT_DEBUG_L1(fmt, ...) do { if constexpr (GOPT_DEBUG_LEVEL >= 1) std::cerr << std::format("[GOPT_DBG: L1]: {}\n", std::format(fmt __VA_OPT__(,) __VA_ARGS__)); } while(0)
#define GOPT_DEBUG_L2(fmt, ...) do { if constexpr (GOPT_DEBUG_LEVEL >= 2) std::cerr << std::format("[GOPT_DBG: L2]: {}\n", std::format(fmt __VA_OPT__(,) __VA_ARGS__)); } while(0)
#define GOPT_DEBUG_L3(fmt, ...) do { if constexpr (GOPT_DEBUG_LEVEL >= 3) std::cerr << std::format("[GOPT_DBG: L3]: {}\n", std::format(fmt __VA_OPT__(,) __VA_ARGS__)); } while(0)

#define GOPT_ASSERT_LOC(loc, expr, fmt, ...) \
    do {\
        if (!(expr)) {\
            std::cerr << std::format("{}:{}: [\033[1;31mFATAL\033[0m]: {}\n", loc.file_name(), loc.line(), std::format(fmt __VA_OPT__(,) __VA_ARGS__));\
            std::exit(EXIT_FAILURE);\
        }\
    } while(false)

namespace gopt {

// Status returned for every usage error, distinct from success and from the
// caller's own failure codes.
inline constexpr int USAGE_ERROR = 2;

// -----------------------------------------------------------------------------
// TYPES
// -----------------------------------------------------------------------------

using Opt_id = uint32_t;

enum Opt_kind : uint8_t { Flag, Valued };

struct Binding
{
    char id;
    Opt_kind kind;
    std::string deflt;

    [[nodiscard]] auto name() const -> std::string { return std::string(1, id); }
};

struct Bounds
{
    std::size_t min = 0;
    std::optional<std::size_t> max{};
};

struct Usage_error
{
    int status = USAGE_ERROR;
    std::vector<std::string> lines;

    [[nodiscard]] auto message() const -> std::string;
};

// -----------------------------------------------------------------------------
// UTILITIES
// -----------------------------------------------------------------------------

[[nodiscard]] constexpr bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

[[nodiscard]] constexpr bool is_identifier(char c) noexcept
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || is_digit(c);
}

// Non-negative decimal count, whole string or nothing.
[[nodiscard]] inline auto parse_count(std::string_view s) -> std::optional<std::size_t>
{
    if (s.empty()) return std::nullopt;
    std::size_t v{};
    auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || p != s.data() + s.size()) return std::nullopt;
    return v;
}

// -----------------------------------------------------------------------------
// PARSER CONFIG & STREAM
// -----------------------------------------------------------------------------

struct Parser_config
{
    // `--` ends option scanning and is consumed; when off it is the first positional.
    bool stop_on_double_dash = true;
    // GNU-style permutation: keep scanning for options after a positional.
    bool allow_interleaved = false;
};

class Arg_stream
{
    std::span<const std::string_view> args_;
    std::size_t cur_ = 0;

public:
    explicit Arg_stream(std::span<const std::string_view> args) : args_(args) {}

    [[nodiscard]] bool empty() const { return cur_ >= args_.size(); }

    [[nodiscard]] std::optional<std::string_view> peek() const
    {
        if (empty()) return std::nullopt;
        return args_[cur_];
    }

    std::optional<std::string_view> pop()
    {
        if (empty()) return {};
        return args_[cur_++];
    }

    void rewind() { if (cur_ > 0) cur_--; }

    [[nodiscard]] std::size_t cursor() const { return cur_; }
    [[nodiscard]] std::span<const std::string_view> rest() const { return args_.subspan(cur_); }
};

// -----------------------------------------------------------------------------
// RESULT
// -----------------------------------------------------------------------------

class Result
{
    std::vector<Binding> bindings_;
    std::vector<std::string> values_;
    std::unordered_map<char, Opt_id> short_to_id_;
    std::vector<std::string> positionals_;
    std::size_t consumed_ = 0;

    friend class Plan;

public:
    [[nodiscard]] bool has(char id) const { return short_to_id_.contains(id); }

    [[nodiscard]]
    auto get(char id, std::source_location loc = std::source_location::current()) const -> const std::string&
    {
        return values_[lookup(id, loc)];
    }

    [[nodiscard]]
    auto flag(char id, std::source_location loc = std::source_location::current()) const -> bool
    {
        auto idx = lookup(id, loc);
        GOPT_ASSERT_LOC(loc, bindings_[idx].kind == Opt_kind::Flag, "Option '-{}' is not a flag", id);
        return values_[idx] == "1";
    }

    [[nodiscard]]
    auto value(char id, std::source_location loc = std::source_location::current()) const -> const std::string&
    {
        auto idx = lookup(id, loc);
        GOPT_ASSERT_LOC(loc, bindings_[idx].kind == Opt_kind::Valued, "Option '-{}' takes no value", id);
        return values_[idx];
    }

    [[nodiscard]] auto bindings() const -> const std::vector<Binding>& { return bindings_; }
    [[nodiscard]] auto positionals() const -> const std::vector<std::string>& { return positionals_; }

    // Leading tokens eaten by option scanning, `--` included.
    [[nodiscard]] std::size_t consumed() const { return consumed_; }

private:
    auto lookup(char id, std::source_location loc) const -> Opt_id
    {
        auto it = short_to_id_.find(id);
        GOPT_ASSERT_LOC(loc, it != short_to_id_.end(), "Option '-{}' was not declared", id);
        return it->second;
    }
};

// -----------------------------------------------------------------------------
// PLAN
// -----------------------------------------------------------------------------

class Plan
{
public:
    Parser_config cfg_;

    [[nodiscard]] bool ok() const noexcept { return ok_; }
    [[nodiscard]] auto error() const -> const std::string& { return error_; }
    [[nodiscard]] auto optstring() const -> const std::string& { return optstring_; }
    [[nodiscard]] auto bindings() const -> const std::vector<Binding>& { return bindings_; }
    [[nodiscard]] auto bounds() const -> const Bounds& { return bounds_; }

    [[nodiscard]] auto find(char id) const -> const Binding*
    {
        if (auto it = short_to_id_.find(id); it != short_to_id_.end()) return &bindings_[it->second];
        return nullptr;
    }

    auto run(std::span<const std::string_view> args, std::ostream& err = std::cerr, std::string_view usage = {}) const
        -> std::expected<Result, Usage_error>;
    auto run(std::span<const std::string> args, std::ostream& err = std::cerr, std::string_view usage = {}) const
        -> std::expected<Result, Usage_error>;
    auto run(int argc, char* argv[], std::ostream& err = std::cerr, std::string_view usage = {}) const
        -> std::expected<Result, Usage_error>;

private:
    friend auto compile(std::string_view optstring, Bounds bounds, std::ostream& err) -> Plan;
    friend auto compile(std::string_view optstring, std::string_view min_args, std::string_view max_args,
                        std::ostream& err) -> Plan;
    friend class Schema;

    enum Scan_state : uint8_t { Scanning, Stopped, Done };

    bool ok_ = false;
    std::string error_;
    std::string optstring_;
    std::vector<Binding> bindings_;
    std::unordered_map<char, Opt_id> short_to_id_;
    Bounds bounds_;

    void declare(char id, Opt_kind kind);
    auto reject(std::string msg, std::ostream& err) -> Plan&;
    auto defaults() const -> Result;
    auto scan_token(std::string_view tok, Arg_stream& args, Result& res, std::vector<std::string>& diag) const -> bool;
};

// -----------------------------------------------------------------------------
// COMPILER
// -----------------------------------------------------------------------------

// Compiles a getopts-style optstring. Diagnostics for malformed input go to
// `err`; the returned plan then fails on run() without writing anything else.
auto compile(std::string_view optstring, Bounds bounds, std::ostream& err = std::cerr) -> Plan;

// Bounds as text: empty min means 0, empty max means unbounded.
auto compile(std::string_view optstring, std::string_view min_args = "0", std::string_view max_args = "",
             std::ostream& err = std::cerr) -> Plan;

class Schema
{
    std::vector<std::pair<char, Opt_kind>> decls_;
    Bounds bounds_;

public:
    auto flag(char id) -> Schema&
    {
        decls_.emplace_back(id, Opt_kind::Flag);
        return *this;
    }

    auto valued(char id) -> Schema&
    {
        decls_.emplace_back(id, Opt_kind::Valued);
        return *this;
    }

    auto min_args(std::size_t n) -> Schema&
    {
        bounds_.min = n;
        return *this;
    }

    auto max_args(std::size_t n) -> Schema&
    {
        bounds_.max = n;
        return *this;
    }

    // The equivalent optstring, e.g. flag('a').valued('f') -> "af:".
    [[nodiscard]] auto optstring() const -> std::string;

    [[nodiscard]] auto compile(std::ostream& err = std::cerr) const -> Plan;
};

} // namespace gopt

// -----------------------------------------------------------------------------
// FORMATTERS (Global/std Scope)
// -----------------------------------------------------------------------------

template<>
struct std::formatter<gopt::Opt_kind> : std::formatter<std::string_view>
{
    auto format(gopt::Opt_kind k, format_context& ctx) const
    {
        std::string_view name = "unknown";
        switch (k) {
            case gopt::Opt_kind::Flag:   name = "Flag";   break;
            case gopt::Opt_kind::Valued: name = "Valued"; break;
        }
        return std::formatter<std::string_view>::format(name, ctx);
    }
};

template<>
struct std::formatter<gopt::Binding, char>
{
    constexpr auto parse(std::format_parse_context& ctx) { return ctx.begin(); }

    auto format(const gopt::Binding& b, std::format_context& ctx) const
    {
        if (b.kind == gopt::Opt_kind::Flag) return std::format_to(ctx.out(), "{}={}", b.id, b.deflt);
        return std::format_to(ctx.out(), "{}='{}'", b.id, b.deflt);
    }
};

template<>
struct std::formatter<gopt::Bounds, char>
{
    constexpr auto parse(std::format_parse_context& ctx) { return ctx.begin(); }

    auto format(const gopt::Bounds& b, std::format_context& ctx) const
    {
        if (b.max) return std::format_to(ctx.out(), "min={}, max={}", b.min, *b.max);
        return std::format_to(ctx.out(), "min={}, max=-", b.min);
    }
};

template<>
struct std::formatter<gopt::Plan, char>
{
    constexpr auto parse(std::format_parse_context& ctx) { return ctx.begin(); }

    auto format(const gopt::Plan& p, std::format_context& ctx) const
    {
        auto out = ctx.out();
        if (!p.ok()) return std::format_to(out, "Plan{{ failed: {} }}", p.error());

        out = std::format_to(out, "Plan{{ optstring='{}', bindings=[", p.optstring());
        bool first = true;
        for (const auto& b : p.bindings())
        {
            if (first) out = std::format_to(out, "{}", b);
            else       out = std::format_to(out, " {}", b);
            first = false;
        }
        return std::format_to(out, "], {} }}", p.bounds());
    }
};

template<>
struct std::formatter<gopt::Usage_error, char>
{
    constexpr auto parse(std::format_parse_context& ctx) { return ctx.begin(); }

    auto format(const gopt::Usage_error& e, std::format_context& ctx) const
    {
        auto out = ctx.out();
        for (const auto& line : e.lines) out = std::format_to(out, "{}\n", line);
        return out;
    }
};

#ifdef GOPT_IMPLEMENTATION

namespace gopt {

// -----------------------------------------------------------------------------
// IMPLEMENTATION: USAGE ERROR
// -----------------------------------------------------------------------------

auto Usage_error::message() const -> std::string
{
    std::string out;
    for (const auto& line : lines)
    {
        if (!out.empty()) out += '\n';
        out += line;
    }
    return out;
}

// -----------------------------------------------------------------------------
// IMPLEMENTATION: COMPILER
// -----------------------------------------------------------------------------

void Plan::declare(char id, Opt_kind kind)
{
    if (auto it = short_to_id_.find(id); it != short_to_id_.end())
    {
        // Repeated identifier: value-taking wins.
        auto& b = bindings_[it->second];
        if (kind == Opt_kind::Valued && b.kind == Opt_kind::Flag)
        {
            GOPT_DEBUG_L3("  -> Upgrading '-{}' to {}", id, Opt_kind::Valued);
            b.kind = Opt_kind::Valued;
            b.deflt.clear();
        }
        return;
    }

    auto id_num = static_cast<Opt_id>(bindings_.size());
    bindings_.push_back(Binding{ id, kind, kind == Opt_kind::Flag ? "0" : "" });
    short_to_id_.emplace(id, id_num);
    GOPT_DEBUG_L3("  -> Declared {} as {} (ID: {})", bindings_.back(), kind, id_num);
}

auto Plan::reject(std::string msg, std::ostream& err) -> Plan&
{
    GOPT_DEBUG_L1("Compile: Rejected ({})", msg);
    err << std::format("{}\n", msg);
    ok_ = false;
    error_ = std::move(msg);
    bindings_.clear();
    short_to_id_.clear();
    return *this;
}

auto compile(std::string_view optstring, Bounds bounds, std::ostream& err) -> Plan
{
    GOPT_DEBUG_L1("Compile: Start (optstring='{}')", optstring);
    Plan plan;

    // Silent-reporting marker is a getopts detail; errors are always reported.
    if (optstring.starts_with(':')) optstring.remove_prefix(1);
    plan.optstring_ = std::string(optstring);
    plan.bounds_ = bounds;

    bool valid = std::ranges::all_of(optstring, [](char c) { return is_identifier(c) || c == ':'; })
              && optstring.find("::") == std::string_view::npos
              && !optstring.starts_with(':');
    if (!valid) return std::move(plan.reject(std::format("Invalid optstring: {}", plan.optstring_), err));

    // A marker belongs to the identifier on its left, so walk right to left and
    // remember what was just passed.
    char last = '\0';
    for (std::size_t i = optstring.size(); i-- > 0;)
    {
        char c = optstring[i];
        if (c != ':')
        {
            // Numeric identifiers are always flags, marker or not.
            Opt_kind kind = (last == ':' && !is_digit(c)) ? Opt_kind::Valued : Opt_kind::Flag;
            plan.declare(c, kind);
        }
        last = c;
    }

    std::ranges::reverse(plan.bindings_);
    for (std::size_t i = 0; i < plan.bindings_.size(); ++i)
        plan.short_to_id_[plan.bindings_[i].id] = static_cast<Opt_id>(i);

    plan.ok_ = true;
    GOPT_DEBUG_L1("Compile: {}", plan);
    return plan;
}

auto compile(std::string_view optstring, std::string_view min_args, std::string_view max_args, std::ostream& err) -> Plan
{
    Bounds bounds;

    if (!min_args.empty())
    {
        auto n = parse_count(min_args);
        if (!n)
        {
            Plan plan;
            return std::move(plan.reject(std::format("Invalid min_args: {}", min_args), err));
        }
        bounds.min = *n;
    }

    if (!max_args.empty())
    {
        auto n = parse_count(max_args);
        if (!n)
        {
            Plan plan;
            return std::move(plan.reject(std::format("Invalid max_args: {}", max_args), err));
        }
        bounds.max = *n;
    }

    return compile(optstring, bounds, err);
}

auto Schema::optstring() const -> std::string
{
    std::string out;
    for (const auto& [id, kind] : decls_)
    {
        out += id;
        if (kind == Opt_kind::Valued) out += ':';
    }
    return out;
}

auto Schema::compile(std::ostream& err) const -> Plan
{
    // ':' as an identifier would be read back as a marker.
    if (std::ranges::any_of(decls_, [](const auto& d) { return !is_identifier(d.first); }))
    {
        Plan plan;
        return std::move(plan.reject(std::format("Invalid optstring: {}", optstring()), err));
    }
    return gopt::compile(optstring(), bounds_, err);
}

// -----------------------------------------------------------------------------
// IMPLEMENTATION: PARSE ENGINE
// -----------------------------------------------------------------------------

auto Plan::defaults() const -> Result
{
    Result res;
    res.bindings_ = bindings_;
    res.short_to_id_ = short_to_id_;
    res.values_.reserve(bindings_.size());
    for (const auto& b : bindings_) res.values_.push_back(b.deflt);
    return res;
}

// One option token, e.g. "-ab" or "-fvalue". Returns false after recording a
// diagnostic.
auto Plan::scan_token(std::string_view tok, Arg_stream& args, Result& res, std::vector<std::string>& diag) const -> bool
{
    std::string_view body = tok.substr(1);

    while (!body.empty())
    {
        char key = body.front();
        body.remove_prefix(1);

        auto it = short_to_id_.find(key);
        if (it == short_to_id_.end())
        {
            diag.push_back(std::format("Unknown option '-{}'", key));
            // getopts stays on a token it has not finished, so it counts as positional.
            if (!body.empty()) args.rewind();
            return false;
        }

        auto id = it->second;
        GOPT_DEBUG_L2("  -> Matched Short Option: -{} (ID: {}, {})", key, id, bindings_[id].kind);

        if (bindings_[id].kind == Opt_kind::Flag)
        {
            res.values_[id] = "1";
            continue;
        }

        if (!body.empty())
        {
            GOPT_DEBUG_L3("     -> Consuming attached value: '{}'", body);
            res.values_[id] = std::string(body);
            return true;
        }

        auto next = args.pop();
        if (!next)
        {
            diag.push_back(std::format("Option '-{}' requires an argument", key));
            return false;
        }
        GOPT_DEBUG_L3("     -> Consuming value arg: '{}'", *next);
        res.values_[id] = std::string(*next);
    }
    return true;
}

auto Plan::run(std::span<const std::string_view> argv, std::ostream& err, std::string_view usage) const
    -> std::expected<Result, Usage_error>
{
    GOPT_DEBUG_L1("Parse: Start ({} args)", argv.size());

    // The compile diagnostic was already written.
    if (!ok_) return std::unexpected(Usage_error{ USAGE_ERROR, { error_ } });

    Result res = defaults();
    std::vector<std::string> diag;
    std::vector<std::string_view> positionals;
    Arg_stream args(argv);
    Scan_state state = Scan_state::Scanning;

    while (state != Scan_state::Done)
    {
        if (state == Scan_state::Stopped)
        {
            state = Scan_state::Done;
            continue;
        }

        auto tok = args.peek();
        if (!tok)
        {
            state = Scan_state::Done;
            continue;
        }
        GOPT_DEBUG_L2("ParseLoop: Processing Token '{}'", *tok);

        if (*tok == "--" && cfg_.stop_on_double_dash)
        {
            GOPT_DEBUG_L2("  -> Found '--', stopping option parsing");
            args.pop();
            state = Scan_state::Stopped;
            continue;
        }

        if (*tok != "--" && tok->size() > 1 && tok->front() == '-')
        {
            args.pop();
            if (!scan_token(*tok, args, res, diag)) state = Scan_state::Done;
            continue;
        }

        if (!cfg_.allow_interleaved)
        {
            state = Scan_state::Done;
            continue;
        }

        GOPT_DEBUG_L3("  -> Storing as positional: '{}'", *tok);
        positionals.push_back(*args.pop());
    }

    res.consumed_ = args.cursor() - positionals.size();
    auto rest = args.rest();
    positionals.insert(positionals.end(), rest.begin(), rest.end());
    res.positionals_.assign(positionals.begin(), positionals.end());

    // Counted even after a scan failure, so both lines can appear.
    std::size_t count = res.positionals_.size();
    if (count < bounds_.min)
        diag.push_back(std::format("Insufficient arguments; minimum {}", bounds_.min));
    else if (bounds_.max && count > *bounds_.max)
        diag.push_back(std::format("Too many arguments; maximum {}", *bounds_.max));

    if (!diag.empty())
    {
        if (!usage.empty()) diag.push_back(std::format("Usage: {}", usage));
        Usage_error e{ USAGE_ERROR, std::move(diag) };
        err << std::format("{}", e);
        GOPT_DEBUG_L1("Parse: Failed with status {}", e.status);
        return std::unexpected(std::move(e));
    }

    GOPT_DEBUG_L1("Parse: Success (consumed {}, positionals {})", res.consumed_, count);
    return res;
}

auto Plan::run(std::span<const std::string> args, std::ostream& err, std::string_view usage) const
    -> std::expected<Result, Usage_error>
{
    std::vector<std::string_view> views(args.begin(), args.end());
    return run(std::span<const std::string_view>(views), err, usage);
}

auto Plan::run(int argc, char* argv[], std::ostream& err, std::string_view usage) const
    -> std::expected<Result, Usage_error>
{
    std::vector<std::string_view> views;
    for (int i = 1; i < argc; ++i) views.emplace_back(argv[i]);
    return run(std::span<const std::string_view>(views), err, usage);
}

} // namespace gopt

#endif // GOPT_IMPLEMENTATION

#endif // !__GOPT_HPP_
