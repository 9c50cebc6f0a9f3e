#include "config.hpp"

#include <cstdlib>

#include <CLI/CLI.hpp>

Config::Config(int argc, char *argv[])
{
    CLI::App app{"Shuttle HTTP Client"};

    app.add_option("url", url, "Target URL, or a path when --base-url is given")
        ->required();
    app.add_option("--base-url", baseUrl, "Prefix prepended verbatim to the target");

    app.add_option("-X,--request", method, "Request method")
        ->default_val(method);
    app.add_option("-H,--header", headers, "Extra header, `Name: value`");
    auto *dataOption = app.add_option("-d,--data", data, "Request body");
    app.add_flag("--json", isJson, "Send the body as application/json");

    app.add_flag_callback("--http1.0", [&](){ httpVersion = HttpVersion::VERSION_1_0; }, "Uses HTTP 1.0");
    app.add_flag_callback("--http1.1", [&](){ httpVersion = HttpVersion::VERSION_1_1; }, "Uses HTTP 1.1");
    app.add_flag_callback("--http2", [&](){ httpVersion = HttpVersion::VERSION_2; }, "Uses HTTP 2");

    app.add_flag("-k,--insecure", insecure, "Allow insecure server connections when using SSL")
        ->default_val(insecure);

    app.add_flag("--no-location", noFollow, "Do not follow redirects");
    app.add_option("--max-redirs", maxRedirs, "Maximum number of redirects allowed")
        ->default_val(maxRedirs);
    app.add_option("--connect-timeout", connectTimeout, "Seconds allowed for the connection phase")
        ->default_val(connectTimeout);
    app.add_option("--max-memory", maxMemory, "Response bytes kept in memory before spilling to disk")
        ->default_val(maxMemory);

    app.add_option("--auth", auth, "Basic HTTP auth credentials");
    app.add_option("--retry", retry, "Retries after transport errors and 429/502/503/504")
        ->check(CLI::NonNegativeNumber);

    app.add_flag("-i,--include", isInclude, "Print response headers");
    app.add_flag("--verbose", isVerbose, "Make the operation more talkative");

    try {
        app.parse(argc, argv);
    }
    catch (CLI::ParseError const& e) {
        std::exit(app.exit(e));
    }

    hasData = dataOption->count() > 0;
}
