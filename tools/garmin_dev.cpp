#include <garmindev/app/Application.hpp>

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    std::vector<std::string> args;
    args.reserve(argc > 1 ? static_cast<std::size_t>(argc - 1) : 0U);
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return GD::App::RunApplication(args, std::cin, std::cout, std::cerr);
}
