#include <csignal>
#include <unistd.h>

#include <atomic>
#include <cctype>
#include <cstdlib>
#include <string>
#include <vector>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "json_io.hpp"
#include "planner.hpp"

static std::atomic<bool> interrupted{false};

void print_plan(const Plan& plan, const std::vector<Child>& children) {
    for (const auto& [child_id, a] : plan.assignments)
        fmt::print("{} - {:t}: {} with {}\n", a.start, a.start.session_end(), child_id, a.teacher_id);
    for (const auto& child : children)
        if (!plan.is_assigned(child.get_id()))
            fmt::print("UNASSIGNED: {} ({})\n", child.get_name(), child.get_id());
    for (const auto& v : plan.violations)
        fmt::print("{}: {}\n", v.kind, v.detail);
    for (const auto& entry : plan.changes)
        if (entry.kind != change_kind::UNCHANGED)
            fmt::print("{}: {}\n", entry.kind, entry.child_id);
    fmt::print("status: {}, score: {:.3f}, runtime: {} ms\n", plan.status, plan.score.total(), plan.runtime.count());
}

void signal_handler(int signal) {
    if (signal == SIGINT)
        interrupted = true;
}

struct arguments {
    const char *json_input;
    const char *json_output;
    const char *json_previous;
    double time_limit;
    unsigned num_workers;
    unsigned random_seed;
    bool verbose;
};

class argument_exception : public std::exception {
    public:
        argument_exception(const std::string &&msg) : msg{msg} {}
        const char* what() const noexcept override { return msg.c_str(); }
    private:
        const std::string msg;
};

arguments parse_arguments(int argc, char* const* argv) {
    arguments ret{
        .json_input = nullptr,
        .json_output = nullptr,
        .json_previous = nullptr,
        .time_limit = default_time_limit_seconds,
        .num_workers = default_num_workers,
        .random_seed = 0,
        .verbose = false,
    };

    int c;
    opterr = 0;
    while ((c = getopt(argc, argv, "i:o:p:t:w:s:vh")) != -1)
        switch (c) {
            case 'h':
                fmt::print("usage: {} "
                           "-i <input-json> "
                           "[-o <output-json>] "
                           "[-p <previous-plan-json>] "
                           "[-t <time-limit-seconds>] "
                           "[-w <workers>] "
                           "[-s <seed>] "
                           "[-v]\n", argv[0]);
                exit(EXIT_SUCCESS);

            case 'i':
                ret.json_input = optarg;
                break;

            case 'o':
                ret.json_output = optarg;
                break;

            case 'p':
                ret.json_previous = optarg;
                break;

            case 't':
                ret.time_limit = atof(optarg);
                if (ret.time_limit <= 0)
                    throw argument_exception(fmt::format("time limit needs to be positive, but is `{}'", optarg));
                break;

            case 'w':
                ret.num_workers = atoi(optarg);
                if (ret.num_workers == 0)
                    throw argument_exception(fmt::format("worker count needs to be positive, but is `{}'", optarg));
                break;

            case 's':
                ret.random_seed = atoi(optarg);
                break;

            case 'v':
                ret.verbose = true;
                break;

            case '?':
                if (optopt == 'i' || optopt == 'o' || optopt == 'p' || optopt == 't' || optopt == 'w' || optopt == 's')
                    throw argument_exception(fmt::format("Option -{:c} requires an argument.", char(optopt)));
                else if (isprint(optopt))
                    throw argument_exception(fmt::format("Unknown option `-{:c}'.", char(optopt)));
                else
                    throw argument_exception(fmt::format("Unknown option character `\\x{:x}'.", optopt));
            default:
                throw argument_exception("unknown error");
        }

    if (optind < argc)
        throw argument_exception(fmt::format("Unknown argument `{}'", argv[optind]));
    if (!ret.json_input)
        throw argument_exception("an input file is required (-i)");

    return ret;
}

int main(int argc, char* const* argv) {
    arguments args;
    try {
        args = parse_arguments(argc, argv);
    } catch (argument_exception &ex) {
        fmt::print(stderr, "Error: {}\n", ex.what());
        return EXIT_FAILURE;
    }

    auto cfg = default_solve_config();
    cfg.time_limit_seconds = args.time_limit;
    cfg.num_workers = args.num_workers;
    cfg.random_seed = args.random_seed;
    cfg.verbose = args.verbose;
    cfg.log_search_progress = args.verbose;

    std::signal(SIGINT, signal_handler);

    try {
        auto instance = read_instance(read_json_file(args.json_input));
        if (args.json_previous)
            instance.previous = read_previous_plan(read_json_file(args.json_previous));

        const Planner planner(cfg);
        const solve_hooks hooks{
            .cancel = &interrupted,
            .on_progress = [&](const search_progress& p) {
                if (args.verbose)
                    fmt::print(stderr, "{:.1f}s: {} assigned, score {:.3f}\n", p.elapsed_seconds, p.assigned, p.score);
            },
        };
        const Plan plan = planner.solve(instance.children, instance.teachers, instance.tandems, instance.weights,
                                        instance.previous, std::nullopt, hooks);

        if (args.json_output) {
            write_json_file(args.json_output, export_plan(plan, instance.children));
        } else {
            print_plan(plan, instance.children);
        }
    } catch (validation_error &ex) {
        for (const auto& problem : ex.get_problems())
            fmt::print(stderr, "Error: {}\n", problem);
        return EXIT_FAILURE;
    } catch (io_error &ex) {
        fmt::print(stderr, "Error: {}\n", ex.what());
        return EXIT_FAILURE;
    } catch (nlohmann::json::exception &ex) {
        fmt::print(stderr, "Error: malformed input: {}\n", ex.what());
        return EXIT_FAILURE;
    } catch (solver_fault &ex) {
        fmt::print(stderr, "Internal error: {}\n", ex.what());
        return 2;
    }

    return EXIT_SUCCESS;
}
