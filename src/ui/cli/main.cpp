#include "CliApp.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv)
{
    try
    {
        std::vector<std::string> args{};
        for (int i{ 1 }; i < argc; ++i)
        {
            args.emplace_back(argv[i]);
        }

        pulid::ui::cli::CliApp app{ std::cout, std::cerr, &pulid::ui::cli::makeEntropySourceByName };
        return app.run(args);
    }
    catch (const std::exception& e)
    {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
