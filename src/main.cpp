#include <secr/idgen/api/exception.hpp>
#include <secr/idgen/api/json.hpp>
#include <secr/idgen/codegen/exception.hpp>
#include <secr/idgen/codegen/transform.hpp>
#include <valuelib/debug/unwrap.hpp>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/program_options.hpp>

#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace po = boost::program_options;
namespace logging = boost::log;

namespace {

    enum exit_status
    {
        success = 0,
        generation_failed = 1,
        usage_error = 2,
    };

    struct options
    {
        std::string input;
        std::string output;
        std::string diagnostics_json;
        bool check = false;
        logging::trivial::severity_level log_level = logging::trivial::warning;
    };

    std::string read_file(const std::string& path)
    {
        std::ifstream in(path, std::ios::binary);
        if (not in)
            throw std::runtime_error("cannot open " + path);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    void write_file(const std::string& path, const std::string& text)
    {
        auto temp = path + ".tmp";
        {
            std::ofstream out(temp, std::ios::binary | std::ios::trunc);
            if (not out)
                throw std::runtime_error("cannot create " + temp);
            out << text;
            out.close();
            if (not out)
                throw std::runtime_error("cannot write " + temp);
        }
        if (std::rename(temp.c_str(), path.c_str()) != 0)
        {
            std::remove(temp.c_str());
            throw std::runtime_error("cannot replace " + path);
        }
    }

    void init_logging(logging::trivial::severity_level level)
    {
        logging::add_console_log(std::clog, logging::keywords::format = "idgen: %Message%");
        logging::core::get()->set_filter(logging::trivial::severity >= level);
    }

    void report(const options& opts, const std::exception_ptr& ep)
    {
        secr::idgen::Diagnostic diagnostic;
        secr::idgen::api::populate(diagnostic, ep);

        auto& where = diagnostic.location();
        if (where.file().empty())
        {
            BOOST_LOG_TRIVIAL(error) << opts.input << ": error: "
            << diagnostic.kind() << ": " << diagnostic.message();
            BOOST_LOG_TRIVIAL(debug) << value::debug::unwrap(ep);
        }
        else
        {
            BOOST_LOG_TRIVIAL(error) << secr::idgen::codegen::to_string(where) << ": error: "
            << diagnostic.kind() << ": " << diagnostic.message();
        }

        if (not opts.diagnostics_json.empty())
        {
            try {
                write_file(opts.diagnostics_json, secr::idgen::api::as_json(diagnostic));
            }
            catch(const std::exception& e)
            {
                BOOST_LOG_TRIVIAL(error) << "cannot write diagnostics: " << e.what();
            }
        }
    }

    int run(const options& opts)
    {
        try {
            auto result = secr::idgen::codegen::transform(opts.input, read_file(opts.input));
            BOOST_LOG_TRIVIAL(info) << opts.input << ": expanded " << result.declarations
            << " declaration(s), folded " << result.literals << " literal(s)";

            if (not opts.check)
                write_file(opts.output, result.text);
            return success;
        }
        catch(...)
        {
            report(opts, std::current_exception());
        }

        if (not opts.check)
            std::remove(opts.output.c_str());
        return generation_failed;
    }
}

int main(int argc, char** argv)
{
    options opts;

    po::options_description visible("Usage: idgen [options] <input>\n\nOptions");
    visible.add_options()
    ("help,h", "print this message")
    ("output,o", po::value(&opts.output), "file to write the expanded header to")
    ("check", po::bool_switch(&opts.check), "validate only, write nothing")
    ("diagnostics-json", po::value(&opts.diagnostics_json),
     "on failure, write the diagnostic as JSON to this file")
    ("log-level", po::value(&opts.log_level)->default_value(logging::trivial::warning, "warning"),
     "trace, debug, info, warning, error or fatal");

    po::options_description all;
    all.add(visible);
    all.add_options()("input", po::value(&opts.input));

    po::positional_options_description positional;
    positional.add("input", 1);

    try {
        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv)
                  .options(all)
                  .positional(positional)
                  .run(),
                  vm);
        po::notify(vm);

        if (vm.count("help"))
        {
            std::cout << visible << std::endl;
            return success;
        }
        if (opts.input.empty())
            throw po::error("no input file");
        if (opts.output.empty() and not opts.check)
            throw po::error("--output is required unless --check is given");
    }
    catch(const po::error& e)
    {
        std::cerr << "idgen: " << e.what() << "\n" << visible << std::endl;
        return usage_error;
    }

    init_logging(opts.log_level);
    return run(opts);
}
