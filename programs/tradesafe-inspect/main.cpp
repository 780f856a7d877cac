/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#include <iostream>
#include <string>
#include <vector>

#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>

#include <fc/exception/exception.hpp>
#include <fc/filesystem.hpp>
#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>
#include <fc/log/logger_config.hpp>
#include <fc/reflect/variant.hpp>

#include <tradesafe/chain/addressing.hpp>
#include <tradesafe/chain/controller.hpp>
#include <tradesafe/chain/exceptions.hpp>
#include <tradesafe/chain/ledger_database.hpp>
#include <tradesafe/chain/reconciliation.hpp>
#include <tradesafe/utilities/tempdir.hpp>

using namespace tradesafe;
using namespace tradesafe::chain;

namespace po = boost::program_options;

enum return_codes {
    OTHER_FAIL      = -2,
    INITIALIZE_FAIL = -1,
    SUCCESS         = 0,
    MISMATCH_FOUND  = 1
};

namespace detail {

controller::config
load_config(const po::variables_map& vm) {
    auto conf = controller::config();
    if(vm.count("config")) {
        conf = controller::load_config(vm["config"].as<std::string>());
    }
    if(vm.count("program-id")) {
        try {
            conf.program_id = fc::sha256(vm["program-id"].as<std::string>());
        }
        TRADESAFE_CAPTURE_AND_RETHROW(config_exception);
    }
    TRADESAFE_ASSERT(conf.program_id != fc::sha256(), config_exception,
        "Program id is required, provide either --config or --program-id");
    return conf;
}

void
print_addresses(const escrow_addresses& addrs, escrow_id_type escrow_id, trade_id_type trade_id) {
    std::cout << fmt::format("escrow id:          {}\n", escrow_id);
    std::cout << fmt::format("trade id:           {}\n", trade_id);
    std::cout << fmt::format("escrow record:      {}\n", addrs.escrow);
    std::cout << fmt::format("principal vault:    {}\n", addrs.principal_vault);
    std::cout << fmt::format("buyer bond vault:   {}\n", addrs.buyer_bond_vault);
    std::cout << fmt::format("seller bond vault:  {}\n", addrs.seller_bond_vault);
}

}  // namespace detail

int
main(int argc, char** argv) {
    auto desc = po::options_description("Usage: tradesafe-inspect [options]");
    desc.add_options()
        ("help,h", "Print this help message and exit")
        ("snapshot,s", po::value<std::string>(), "Ledger snapshot (JSON) to inspect")
        ("escrow,e", po::value<std::string>(), "Only inspect the escrow record at this address")
        ("derive,d", po::value<std::vector<uint64_t>>()->multitoken(), "Print the addresses derived from <escrow_id> <trade_id>")
        ("config,c", po::value<std::string>(), "Ledger configuration file (JSON)")
        ("program-id,p", po::value<std::string>(), "Program id (hex) used to derive addresses, overrides the configuration")
        ("logging-config,l", po::value<std::string>(), "Logging configuration file (JSON)")
        ("json", po::bool_switch()->default_value(false), "Print the report as JSON");

    try {
        auto vm = po::variables_map();
        try {
            po::store(po::parse_command_line(argc, argv, desc), vm);
            po::notify(vm);
        }
        catch(const po::error& e) {
            std::cerr << e.what() << std::endl << desc << std::endl;
            return INITIALIZE_FAIL;
        }

        if(vm.count("help") || (!vm.count("snapshot") && !vm.count("derive"))) {
            std::cout << desc << std::endl;
            return SUCCESS;
        }

        if(vm.count("logging-config")) {
            auto path = fc::path(vm["logging-config"].as<std::string>());
            if(fc::exists(path)) {
                fc::configure_logging(path);
            }
            else {
                std::cerr << "Logging config file is not available: " << path.string() << std::endl;
            }
        }

        auto conf = detail::load_config(vm);

        if(vm.count("derive")) {
            auto ids = vm["derive"].as<std::vector<uint64_t>>();
            if(ids.size() != 2) {
                std::cerr << "--derive expects exactly two values: <escrow_id> <trade_id>" << std::endl;
                return INITIALIZE_FAIL;
            }

            auto addrs = derive_escrow_addresses(conf.program_id, ids[0], ids[1]);
            detail::print_addresses(addrs, ids[0], ids[1]);

            if(!vm.count("snapshot")) {
                return SUCCESS;
            }
        }

        auto snapshot = ledger_database::read_snapshot(vm["snapshot"].as<std::string>());

        auto tempdir = fc::temp_directory(utilities::temp_directory_path());

        auto db_config    = ledger_database::config();
        db_config.profile = storage_profile::memory;
        db_config.db_path = tempdir.path() / "inspect";

        auto ledger_db = ledger_database(db_config);
        ledger_db.open();
        ledger_db.load_snapshot(snapshot);

        auto mismatches = 0u;
        if(vm.count("escrow")) {
            auto row = inspect_escrow(ledger_db, conf, address::from_string(vm["escrow"].as<std::string>()));
            if(vm["json"].as<bool>()) {
                std::cout << fc::json::to_pretty_string(row) << std::endl;
            }
            else {
                auto report = reconciliation_report();
                report.escrows      = 1;
                report.total_locked = row.actual;
                if(row.actual > 0) {
                    report.accounts_with_funds = 1;
                }
                if(row.status == vault_status::mismatch) {
                    report.mismatches = 1;
                }
                report.rows.emplace_back(row);
                std::cout << format_report(report, conf);
            }
            mismatches = (row.status == vault_status::mismatch) ? 1 : 0;
        }
        else {
            auto report = inspect(ledger_db, conf);
            if(vm["json"].as<bool>()) {
                std::cout << fc::json::to_pretty_string(report) << std::endl;
            }
            else {
                std::cout << format_report(report, conf);
            }
            mismatches = report.mismatches;
        }

        ledger_db.close();

        if(mismatches > 0) {
            elog("Found ${n} escrows whose vault balance doesn't match the tracked balance", ("n", mismatches));
            return MISMATCH_FOUND;
        }
    }
    catch(const fc::exception& e) {
        elog("${e}", ("e", e.to_detail_string()));
        return OTHER_FAIL;
    }
    catch(const boost::exception& e) {
        elog("${e}", ("e", boost::diagnostic_information(e)));
        return OTHER_FAIL;
    }
    catch(const std::exception& e) {
        elog("${e}", ("e", e.what()));
        return OTHER_FAIL;
    }

    return SUCCESS;
}
