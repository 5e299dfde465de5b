#pragma once

#include <filesystem>
#include <string_view>

class CommandLine {
   public:
    using argv_type = char* const*;
    using argc_type = int;

   private:
    argc_type _argc;
    argv_type _argv;

   public:
    CommandLine(argc_type argc, argv_type argv);
    [[nodiscard]] argv_type argv() const;
    [[nodiscard]] argc_type argc() const;
    // Program name as invoked (argv[0])
    [[nodiscard]] std::string_view exe() const;

    bool operator==(const CommandLine& other) const;
};
