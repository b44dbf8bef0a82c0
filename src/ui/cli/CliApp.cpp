#include "CliApp.hpp"
#include "pulid/codec/Base32.hpp"
#include "pulid/core/Pulid.hpp"
#include "pulid/core/PulidError.hpp"
#include "pulid/core/PulidGenerator.hpp"
#include "pulid/core/Timestamp.hpp"
#include "pulid/entropy/providers/NativeEntropySourceFactory.hpp"

#include <CLI/CLI.hpp>
#include <span>
#include <utility>
#include <variant>

#if defined(PULID_ENABLE_OPENSSL)
#include "pulid/entropy/providers/OpenSslEntropySourceFactory.hpp"
#endif

namespace pulid::ui::cli
{
namespace
{

std::string toHex(std::span<const std::uint8_t> bytes)
{
    constexpr char kHex[] = "0123456789abcdef";
    constexpr std::uint8_t kNibbleShift{ 4U };
    constexpr std::uint8_t kNibbleMask{ 0x0FU };

    std::string out{};
    out.reserve(bytes.size() * 2U);
    for (const std::uint8_t b : bytes)
    {
        out.push_back(kHex[(b >> kNibbleShift) & kNibbleMask]);
        out.push_back(kHex[b & kNibbleMask]);
    }
    return out;
}

std::string describe(const pulid::core::PulidError& e)
{
    return std::string{ pulid::core::toString(e.kind()) } + ": " + e.what();
}

} // namespace

[[nodiscard]] std::unique_ptr<pulid::entropy::IEntropySource> makeEntropySourceByName(const std::string& name)
{
    if (name == "native")
    {
        return pulid::entropy::providers::makeNativeEntropySource();
    }
#if defined(PULID_ENABLE_OPENSSL)
    if (name == "openssl")
    {
        return pulid::entropy::providers::makeOpenSslEntropySource();
    }
#endif
    return nullptr;
}

CliApp::CliApp(std::ostream& out, std::ostream& err, EntropySourceFactory entropyFactory,
               pulid::core::MillisClock clock)
    : m_out(out), m_err(err), m_entropyFactory(std::move(entropyFactory)), m_clock(std::move(clock))
{
}

int CliApp::run(const std::vector<std::string>& userArgs)
{
    m_exitCode = g_exitOk;
    m_provider = g_defaultProvider;

    std::vector<std::string> args;
    args.reserve(userArgs.size() + 1);
    args.emplace_back("pulid");
    args.insert(args.end(), userArgs.begin(), userArgs.end());

    CLI::App app{ "Sortable scoped 128-bit identifiers" };
    app.require_subcommand(1);
    // Lets --provider appear after the subcommand name as well.
    app.fallthrough();

    app.add_option("--provider", m_provider, "Entropy provider (native, openssl)")
        ->envname("PULID_ENTROPY_PROVIDER")
        ->capture_default_str();

    // GENERATE
    GenerateOptions genOpts{};
    std::uint64_t timestampArg{};
    auto* subGenerate = app.add_subcommand("generate", "Generate new identifiers");
    subGenerate->add_option("-s,--scope", genOpts.scope, "Public scope, 0 for unscoped")
        ->envname("PULID_SCOPE")
        ->capture_default_str();
    subGenerate->add_option("-n,--count", genOpts.count, "Number of identifiers")->capture_default_str();
    subGenerate->add_option("-f,--format", genOpts.format, "Output form")
        ->check(CLI::IsMember({ "base32", "uuid", "both" }))
        ->capture_default_str();
    auto* tsOpt = subGenerate->add_option("-t,--timestamp", timestampArg, "Milliseconds since the Unix epoch");
    subGenerate->callback(
        [&]()
        {
            if (tsOpt->count() > 0U)
            {
                genOpts.timestampMs = timestampArg;
            }
            doGenerate(genOpts);
        });

    // INSPECT / CONVERT / VALIDATE
    std::string idArg;
    auto* subInspect = app.add_subcommand("inspect", "Print the fields of an identifier");
    subInspect->add_option("id", idArg, "Base32 or UUID form")->required();
    subInspect->callback([&]() { doInspect(idArg); });

    auto* subConvert = app.add_subcommand("convert", "Print the other textual form");
    subConvert->add_option("id", idArg, "Base32 or UUID form")->required();
    subConvert->callback([&]() { doConvert(idArg); });

    auto* subValidate = app.add_subcommand("validate", "Check that an identifier parses");
    subValidate->add_option("id", idArg, "Base32 or UUID form")->required();
    subValidate->callback([&]() { doValidate(idArg); });

    // SELFTEST
    app.add_subcommand("selftest", "Check the entropy source and both codecs")->callback([this]() { doSelfTest(); });

    try
    {
        std::vector<char*> argv;
        argv.reserve(args.size());
        for (const auto& arg : args)
        {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }

        app.parse(static_cast<int>(argv.size()), argv.data());
    }
    catch ([[maybe_unused]] const CLI::CallForHelp&)
    {
        m_out << app.help();
        return g_exitOk;
    }
    catch (const CLI::ParseError& e)
    {
        m_err << "Syntax Error: " << e.what() << "\n";
        return g_exitSyntax;
    }

    return m_exitCode;
}

// --- Handlers ---

void CliApp::fail(const std::string& message)
{
    m_err << "error: " << message << "\n";
    m_exitCode = g_exitFailure;
}

std::unique_ptr<pulid::entropy::IEntropySource> CliApp::openEntropySource()
{
    std::unique_ptr<pulid::entropy::IEntropySource> source{};
    if (m_entropyFactory)
    {
        source = m_entropyFactory(m_provider);
    }
    if (!source)
    {
        fail(std::string{ pulid::core::toString(pulid::core::PulidErrorKind::EntropySource) } + ": provider '" +
             m_provider + "' not available");
    }
    return source;
}

void CliApp::doGenerate(const GenerateOptions& opts)
{
    auto source{ openEntropySource() };
    if (!source)
    {
        return;
    }

    std::optional<pulid::core::PulidGenerator> generator;
    try
    {
        generator.emplace(*source, pulid::core::GeneratorConfig{ .defaultScope = opts.scope }, m_clock);
    }
    catch (const pulid::core::PulidError& e)
    {
        fail(describe(e));
        return;
    }

    std::vector<pulid::core::Pulid> ids;
    if (opts.timestampMs.has_value())
    {
        if (opts.count != 1U)
        {
            fail("range: --timestamp produces exactly one identifier");
            return;
        }
        auto res{ generator->generateAt(*opts.timestampMs, opts.scope) };
        if (const auto* err = std::get_if<pulid::core::PulidError>(&res))
        {
            fail(describe(*err));
            return;
        }
        ids.push_back(std::get<pulid::core::Pulid>(res));
    }
    else
    {
        auto res{ generator->generateBatch(opts.count, opts.scope) };
        if (const auto* err = std::get_if<pulid::core::PulidError>(&res))
        {
            fail(describe(*err));
            return;
        }
        ids = std::get<std::vector<pulid::core::Pulid>>(std::move(res));
    }

    for (const auto& id : ids)
    {
        if (opts.format == "uuid")
        {
            m_out << id.toUuid() << "\n";
        }
        else if (opts.format == "both")
        {
            m_out << id.toBase32() << " " << id.toUuid() << "\n";
        }
        else
        {
            m_out << id.toBase32() << "\n";
        }
    }
}

void CliApp::doInspect(const std::string& text)
{
    try
    {
        const auto id{ pulid::core::Pulid::parse(text) };
        const auto entropy{ id.entropy() };
        m_out << "base32:    " << id.toBase32() << "\n";
        m_out << "uuid:      " << id.toUuid() << "\n";
        m_out << "timestamp: " << id.timestamp() << "\n";
        m_out << "time:      " << pulid::core::formatIso8601(id.timestamp()) << "\n";
        m_out << "scope:     " << id.scope() << "\n";
        m_out << "stored:    " << id.storedScope() << "\n";
        m_out << "entropy:   " << toHex(std::span<const std::uint8_t>{ entropy }) << "\n";
    }
    catch (const pulid::core::PulidError& e)
    {
        fail(describe(e));
    }
}

void CliApp::doConvert(const std::string& text)
{
    try
    {
        const auto id{ pulid::core::Pulid::parse(text) };
        m_out << (text.size() == pulid::codec::g_base32Chars ? id.toUuid() : id.toBase32()) << "\n";
    }
    catch (const pulid::core::PulidError& e)
    {
        fail(describe(e));
    }
}

void CliApp::doValidate(const std::string& text)
{
    try
    {
        static_cast<void>(pulid::core::Pulid::parse(text));
        m_out << "valid\n";
    }
    catch (const pulid::core::PulidError& e)
    {
        m_out << "invalid: " << describe(e) << "\n";
        m_exitCode = g_exitFailure;
    }
}

void CliApp::doSelfTest()
{
    auto source{ openEntropySource() };
    if (!source)
    {
        return;
    }

    pulid::core::PulidGenerator generator{ *source, pulid::core::defaultGeneratorConfig(), m_clock };
    const auto report{ generator.selfTest() };

    auto mark = [](bool ok) { return ok ? "ok" : "FAILED"; };
    m_out << "provider:  " << source->name() << "\n";
    m_out << "entropy:   " << mark(report.entropy) << "\n";
    m_out << "base32:    " << mark(report.base32RoundTrip) << "\n";
    m_out << "uuid:      " << mark(report.uuidRoundTrip) << "\n";
    if (!report.passed())
    {
        m_exitCode = g_exitFailure;
    }
}

} // namespace pulid::ui::cli
