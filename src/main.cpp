#include "cfg/config.hpp"
#include "generator/generator_error.hpp"
#include "generator/id_generator.hpp"
#include "generator/time_source.hpp"
#include "logger/spdlog_init.hpp"
#include "utils/hex.hpp"
#include <algorithm>
#include <boost/exception/diagnostic_information.hpp>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unistd.h>

using namespace std;
using namespace shortid;

static void print_help()
{
    cout << "\nshortid\n\n"
            "Options:\n"
            "  -h    This message\n"
            "  -c    Path to configuration file\n"
            "  -t    Identifier type: uuidv1 (default), short128, short96, short64\n"
            "  -n    Number of identifiers to print (default 1)\n"
            "  -T    Fixed time in nanoseconds since the Unix epoch\n"
         << endl;
}


template<size_t N, size_t M> static discriminator<N> tail(const discriminator<M> &bytes)
{
    static_assert(N <= M);
    discriminator<N> result{};
    copy(bytes.end() - N, bytes.end(), result.begin());
    return result;
}


static string next_id(id_generator &gen, const string &type, const cfg::GeneratorSection &section)
{
    const auto node = section.nodeId();

    if (type == "uuidv1")
        return utils::to_hex(gen.uuidv1(node));
    if (type == "short128")
        return utils::to_hex(gen.next_short_128(tail<4>(node)));
    if (type == "short96")
        return utils::to_hex(gen.next_short_96(tail<3>(node), section.epoch));
    if (type == "short64")
        return utils::to_hex(gen.next_short_64(section.epoch));

    throw invalid_argument("Unknown identifier type: " + type);
}


int main(int argc, char *argv[])
{
    int ch = 0;
    const char *config_file = nullptr;
    string type = "uuidv1";
    string count_arg = "1";
    const char *fixed_time = nullptr;

    if (argc == 1) {
        print_help();
        return EXIT_FAILURE;
    }

    while ((ch = getopt(argc, argv, "hc:t:n:T:")) != -1) {
        switch (ch) {
        case 'c':
            config_file = optarg;
            break;
        case 't':
            type = optarg;
            break;
        case 'n':
            count_arg = optarg;
            break;
        case 'T':
            fixed_time = optarg;
            break;
        case 'h':
        case '?':
        default:
            print_help();
            return EXIT_FAILURE;
        }
    }

    if (config_file == nullptr) {
        print_help();
        return EXIT_FAILURE;
    }

    try {
        const auto config = cfg::loadConfigFile(config_file);
        logging::init_spdlog(config.general);

        const auto count = cfg::fromString<unsigned long>(count_arg);

        unique_ptr<time_source> clock;
        if (fixed_time != nullptr)
            clock = make_unique<manual_time_source>(chrono::nanoseconds{cfg::fromString<long long>(fixed_time)});
        else
            clock = make_unique<system_time_source>();

        id_generator gen(*clock, config.generator.options());
        spdlog::debug("Generating {} {} id(s), worker id {}", count, type, gen.worker_id());

        for (unsigned long i = 0; i < count; ++i)
            cout << next_id(gen, type, config.generator) << '\n';
        cout.flush();

        return EXIT_SUCCESS;
    } catch (const generator_error &e) {
        spdlog::error("Identifier generation failed: {}", e.what());
    } catch (const boost::exception &e) {
        spdlog::error("Boost exception caught: {}", boost::diagnostic_information(e));
    } catch (const exception &e) {
        spdlog::error("Exception caught: {}", e.what());
    }

    return EXIT_FAILURE;
}
