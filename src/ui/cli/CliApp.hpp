#ifndef PULID_UI_CLI_CLIAPP_HPP
#define PULID_UI_CLI_CLIAPP_HPP

#include "pulid/core/GeneratorConfig.hpp"
#include "pulid/entropy/IEntropySource.hpp"

#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pulid::ui::cli
{

// Returns nullptr for an unknown or unavailable provider name.
using EntropySourceFactory = std::function<std::unique_ptr<pulid::entropy::IEntropySource>(const std::string&)>;

constexpr int g_exitOk{ 0 };
constexpr int g_exitFailure{ 1 };
constexpr int g_exitSyntax{ 2 };

constexpr std::string_view g_defaultProvider{ "native" };

class CliApp final
{
public:
    CliApp(std::ostream& out, std::ostream& err, EntropySourceFactory entropyFactory,
           pulid::core::MillisClock clock = pulid::core::systemClockMillis);

    // args excludes the program name.
    int run(const std::vector<std::string>& args);

private:
    struct GenerateOptions final
    {
        std::int64_t scope{ pulid::core::g_defaultPublicScope };
        std::size_t count{ 1U };
        std::string format{ "base32" };
        std::optional<std::uint64_t> timestampMs;
    };

    std::ostream& m_out;
    std::ostream& m_err;
    EntropySourceFactory m_entropyFactory;
    pulid::core::MillisClock m_clock;
    std::string m_provider{ g_defaultProvider };
    int m_exitCode{ g_exitOk };

    void doGenerate(const GenerateOptions& opts);
    void doInspect(const std::string& id);
    void doConvert(const std::string& id);
    void doValidate(const std::string& id);
    void doSelfTest();

    [[nodiscard]] std::unique_ptr<pulid::entropy::IEntropySource> openEntropySource();
    void fail(const std::string& message);
};

[[nodiscard]] std::unique_ptr<pulid::entropy::IEntropySource> makeEntropySourceByName(const std::string& name);

} // namespace pulid::ui::cli

#endif // PULID_UI_CLI_CLIAPP_HPP
