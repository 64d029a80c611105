// PRICEGATE Check - Command Line Price Validator
// Copyright (c) 2024 PRICEGATE Developers
// MIT License

#include <pricegate/cli/check.h>
#include <pricegate/util/logging.h>

#include <iostream>
#include <memory>

int main(int argc, char* argv[]) {
    using namespace pricegate;

    util::ConsoleSink::Options options;
    options.showTimestamp = false;
    util::Logger::Instance().AddSink(std::make_shared<util::ConsoleSink>(options));

    int rc = cli::RunCheck(argc, argv, std::cout);

    util::Logger::Instance().Flush();
    util::Logger::Instance().ClearSinks();
    return rc;
}
