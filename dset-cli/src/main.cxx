#include "dset/dset.hxx"

#include <CLI/CLI.hpp>
#include <fmt/format.h>

#include <initializer_list>
#include <memory_resource>
#include <string>
#include <string_view>
#include <vector>

namespace dset {

struct DebugOptions {
    bool print_buckets = false;
};

struct ArgsOptions {
    bool version = false;
    bool demo = false;
    std::vector<std::string> values;
    std::vector<std::string> union_values;
    std::vector<std::string> intersect_values;
    std::vector<std::string> difference_values;
    std::vector<std::string> contains_values;
    std::vector<std::string> debug_options;
};

[[nodiscard]] std::vector<Value> parse_values(
    const std::vector<std::string>& texts
) {
    std::vector<Value> result;
    result.reserve(texts.size());
    for (const auto& text : texts) { result.push_back(parse_value(text)); }
    return result;
}

[[nodiscard]] std::vector<Value> make_values(std::initializer_list<int_t> ints
) {
    std::vector<Value> result;
    result.reserve(ints.size());
    for (const auto val : ints) { result.emplace_back(val); }
    return result;
}

void apply_debug_options(
    const std::vector<std::string>& names,
    SetOptions& set_options,
    DebugOptions& debug_options
) noexcept {
    for (const std::string_view name : names) {
        if (name == "trace-rehash") {
            set_options.trace_rehash = true;
        } else if (name == "trace-mutations") {
            set_options.trace_mutations = true;
        } else if (name == "print-buckets") {
            debug_options.print_buckets = true;
        } else if (name == "all") {
            set_options.trace_rehash = true;
            set_options.trace_mutations = true;
            debug_options.print_buckets = true;
        }
    }
}

void show(
    const ValueSet& set,
    std::string_view step,
    const DebugOptions& debug_options
) {
    if constexpr (HAS_DEBUG_FEATURES) {
        if (debug_options.print_buckets) { print_buckets(set, step); }
    }
    fmt::print(FMT_STRING("{}\n"), set);
}

// Same sequence of operations as the reference scenario: the final set is
// {1, 2} in some order.
void run_demo(
    const SetOptions& set_options,
    const DebugOptions& debug_options,
    const Allocator& alloc
) {
    ValueSet set(set_options, alloc);
    set.add(Value{int_t{1}});
    set.union_update(make_values({2, 3, 4, 5, 1}));
    show(set, "union", debug_options);
    fmt::print(FMT_STRING("{:d}\n"), set.length());
    set.intersection_update(make_values({4, 5, 2, 1}));
    show(set, "intersection", debug_options);
    set.difference_update(make_values({4, 5, 6, 7}));
    show(set, "difference", debug_options);
    fmt::print(FMT_STRING("{}\n"), set.contains(Value{int_t{2}}));
    fmt::print(FMT_STRING("{:d}\n"), set.length());
}

void run(
    const ArgsOptions& args,
    const SetOptions& set_options,
    const DebugOptions& debug_options,
    const Allocator& alloc
) {
    ValueSet set(parse_values(args.values), set_options, alloc);
    show(set, "values", debug_options);
    if (!args.union_values.empty()) {
        set.union_update(parse_values(args.union_values));
        show(set, "union", debug_options);
    }
    if (!args.intersect_values.empty()) {
        set.intersection_update(parse_values(args.intersect_values));
        show(set, "intersection", debug_options);
    }
    if (!args.difference_values.empty()) {
        set.difference_update(parse_values(args.difference_values));
        show(set, "difference", debug_options);
    }
    for (const auto& text : args.contains_values) {
        fmt::print(
            FMT_STRING("contains {:s}: {}\n"),
            text,
            set.contains(parse_value(text))
        );
    }
    fmt::print(FMT_STRING("length: {:d}\n"), set.length());
}

}  // namespace dset

// NOLINTNEXTLINE(bugprone-exception-escape)
int main(int argc, const char** argv) {
    CLI::App app{fmt::format(
        "{} version {}",
        dset::cmake::project_name,
        dset::cmake::project_version
    )};
    dset::ArgsOptions args;
    app.add_flag("--version", args.version, "Show version and exit.");
    app.add_flag("--demo", args.demo, "Run the reference scenario and exit.");
    app.add_option(
        "--union",
        args.union_values,
        "Values to add with union_update."
    );
    app.add_option(
        "--intersect",
        args.intersect_values,
        "Values to keep with intersection_update."
    );
    app.add_option(
        "--difference",
        args.difference_values,
        "Values to drop with difference_update."
    );
    app.add_option(
        "--contains",
        args.contains_values,
        "Values to look up once all operations are done."
    );
    app.add_option(
           "-D",
           args.debug_options,
           "Debug option(s), only works on builds with debug features."
    )
        ->check(CLI::IsMember(
            {"all", "trace-rehash", "trace-mutations", "print-buckets"}
        ));
    app.add_option(
        "values",
        args.values,
        "Initial values: true/false, integers, floats, 'c', \"text\"."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        const int code = app.exit(e);
        return code == 0 ? dset::to_underlying(dset::ExitCode::SUCCESS)
                         : dset::to_underlying(dset::ExitCode::USAGE_ERROR);
    }

    if (args.version) {
        fmt::print(FMT_STRING("{}\n"), dset::VERSION);
        return dset::to_underlying(dset::ExitCode::SUCCESS);
    }

    dset::SetOptions set_options;
    dset::DebugOptions debug_options;
    if constexpr (dset::HAS_DEBUG_FEATURES) {
        dset::apply_debug_options(
            args.debug_options,
            set_options,
            debug_options
        );
    } else {
        if (!args.debug_options.empty()) {
            fmt::print(
                stderr,
                FMT_STRING("Debug options are not available in this build.\n")
            );
        }
    }

    std::pmr::unsynchronized_pool_resource mem_res;
    std::pmr::memory_resource* mem_res_ptr = nullptr;
    if constexpr (dset::IS_DEBUG_BUILD) {
        mem_res_ptr = std::pmr::get_default_resource();
    } else {
        mem_res_ptr = &mem_res;
    }
    const dset::Allocator alloc(mem_res_ptr);

    if (args.demo) {
        dset::run_demo(set_options, debug_options, alloc);
    } else {
        dset::run(args, set_options, debug_options, alloc);
    }
    return dset::to_underlying(dset::ExitCode::SUCCESS);
}
