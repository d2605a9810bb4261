#include "cli/TetherCli.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>
#include <utility>

#include <QDebug>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/tether_version.hpp"
#include "observe/element_normalizer.hpp"
#include "observe/log_collector.hpp"
#include "observe/watch_loop.hpp"
#include "platform/device_platform.hpp"

namespace tether {

namespace {

const QString kDefaultScreenPath = QStringLiteral("/tmp/tether-screen.png");
constexpr int kDefaultLogLines = 50;
constexpr int kExitInterrupted = 130;
constexpr auto kFollowInterval = std::chrono::milliseconds(500);
// Give the log stream a moment to attach before inspecting.
constexpr auto kInspectLogWarmup = std::chrono::milliseconds(300);

QString usageText()
{
    return QStringLiteral(
        "tether %1 - observe a running mobile app\n"
        "\n"
        "Usage:\n"
        "  tether status                       Platform, device target and state\n"
        "  tether screen [PATH]                Screenshot (default /tmp/tether-screen.png)\n"
        "  tether elements [--json]            Visible UI elements\n"
        "  tether inspect                      Screenshot + elements + recent logs as JSON\n"
        "  tether logcat [--lines N] [--follow]\n"
        "                                      Filtered device logs\n"
        "  tether watch [--timeout S] [--debounce S] [--json]\n"
        "                                      Capture a snapshot whenever the UI settles\n"
        "\n"
        "Global options:\n"
        "  --trace                             Write debug events to the trace log\n")
        .arg(QStringLiteral(TETHER_VERSION));
}

QString getArgValue(const QStringList &args, const QString &name)
{
    const int index = args.indexOf(name);
    if (index >= 0 && index + 1 < args.size()) {
        return args.at(index + 1);
    }
    return QString();
}

// Parses --name VALUE as a number. A missing flag leaves value untouched;
// a flag without a usable number is an error.
bool parseNumberArg(const QStringList &args, const QString &name, double &value)
{
    if (!args.contains(name)) {
        return true;
    }
    bool ok = false;
    const double parsed = getArgValue(args, name).toDouble(&ok);
    if (!ok || parsed < 0) {
        std::cerr << name.toStdString() << " requires a number" << std::endl;
        return false;
    }
    value = parsed;
    return true;
}

const char *severityPrefix(LogSeverity severity)
{
    switch (severity) {
    case LogSeverity::Crash:
        return "!!!";
    case LogSeverity::Error:
        return "ERR";
    case LogSeverity::Info:
        break;
    }
    return "   ";
}

void printLogEntries(const std::vector<LogEntry> &entries)
{
    for (const auto &entry : entries) {
        std::cout << severityPrefix(entry.severity) << " " << entry.line << "\n";
    }
    std::cout.flush();
}

} // namespace

TetherCli::TetherCli(TetherConfig config, const std::atomic<bool> &interrupted)
    : m_config(std::move(config))
    , m_interrupted(interrupted)
    , m_platform(makePlatform(m_config))
{
}

TetherCli::~TetherCli() = default;

int TetherCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        std::cout << usageText().toStdString();
        return 0;
    }

    const QString command = args.at(1);
    if (command == QStringLiteral("help") || command == QStringLiteral("--help")
        || command == QStringLiteral("-h")) {
        std::cout << usageText().toStdString();
        return 0;
    }

    TLOG_INFO(QStringLiteral("TetherCli"),
              QStringLiteral("run"),
              QStringLiteral("cli_command"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              tether::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"command", command.toStdString()},
                              {"platform", toPlatformString(m_config.platform)},
                              {"config", m_config.sourcePath.toStdString()}}));

    if (command == QStringLiteral("status")) {
        return runStatus();
    }
    if (command == QStringLiteral("screen")) {
        return runScreen(args);
    }
    if (command == QStringLiteral("elements")) {
        return runElements(args);
    }
    if (command == QStringLiteral("inspect")) {
        return runInspect();
    }
    if (command == QStringLiteral("logcat")) {
        return runLogcat(args);
    }
    if (command == QStringLiteral("watch")) {
        return runWatch(args);
    }

    std::cerr << "Unknown command: " << command.toStdString() << "\n\n"
              << usageText().toStdString();
    return 1;
}

bool TetherCli::requireDevice()
{
    const ProbeResult probe = m_platform->probe();
    if (probe.available) {
        return true;
    }
    std::cout << "Device not running." << std::endl;
    TLOG_WARN(QStringLiteral("TetherCli"),
              QStringLiteral("requireDevice"),
              QStringLiteral("device_unavailable"),
              QStringLiteral("probe_failed"),
              QStringLiteral("exit_nonzero"),
              tether::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"message", probe.message}}));
    return false;
}

int TetherCli::runStatus()
{
    const ProbeResult probe = m_platform->probe();
    if (m_config.platform == PlatformKind::Ios) {
        std::cout << "Platform: ios\n";
        std::cout << "Simulator: " << m_platform->deviceLabel().toStdString() << "\n";
    } else {
        std::cout << "AVD: " << m_platform->deviceLabel().toStdString() << "\n";
    }
    std::cout << "Device: " << (probe.available ? "running" : "stopped") << std::endl;
    return 0;
}

int TetherCli::runScreen(const QStringList &args)
{
    if (!requireDevice()) {
        return 1;
    }
    QString output = kDefaultScreenPath;
    if (args.size() > 2 && !args.at(2).startsWith(QStringLiteral("--"))) {
        output = args.at(2);
    }
    if (!m_platform->screenshot(output)) {
        std::cout << "Screenshot failed" << std::endl;
        return 1;
    }
    std::cout << output.toStdString() << std::endl;
    return 0;
}

int TetherCli::runElements(const QStringList &args)
{
    if (!requireDevice()) {
        return 1;
    }
    const QString raw = m_platform->dumpRawTree();
    if (raw.isEmpty()) {
        std::cout << "UI dump failed" << std::endl;
        return 1;
    }

    const std::vector<Element> elements = m_platform->parseTree(raw);
    if (args.contains(QStringLiteral("--json"))) {
        const OrderedJson payload = elements;
        std::cout << payload.dump(2) << std::endl;
        return 0;
    }
    for (const auto &element : elements) {
        std::cout << formatElementLine(element) << "\n";
    }
    std::cout.flush();
    return 0;
}

int TetherCli::runInspect()
{
    if (!requireDevice()) {
        return 1;
    }

    std::unique_ptr<LogCollector> logs = makeLogCollector(*m_platform, m_config);
    logs->start();
    std::this_thread::sleep_for(kInspectLogWarmup);

    if (!m_platform->screenshot(kDefaultScreenPath)) {
        std::cerr << "Screenshot failed" << std::endl;
    }
    const QString raw = m_platform->dumpRawTree();
    const std::vector<Element> elements = raw.isEmpty()
        ? std::vector<Element>()
        : m_platform->parseTree(raw);

    const std::vector<LogEntry> entries = logs->drain();
    logs->stop();

    std::vector<std::string> crashes;
    std::vector<std::string> errors;
    for (const auto &entry : entries) {
        if (entry.severity == LogSeverity::Crash) {
            crashes.push_back(entry.line);
        } else if (entry.severity == LogSeverity::Error) {
            errors.push_back(entry.line);
        }
    }
    constexpr std::size_t kMaxErrors = 10;
    if (errors.size() > kMaxErrors) {
        errors.erase(errors.begin(),
                     errors.end() - static_cast<std::ptrdiff_t>(kMaxErrors));
    }

    OrderedJson output;
    output["screenshot"] = kDefaultScreenPath.toStdString();
    output["elements"] = elements;
    if (!crashes.empty()) {
        output["crashes"] = crashes;
    }
    if (!errors.empty()) {
        output["errors"] = errors;
    }
    if (!entries.empty() && crashes.empty() && errors.empty()) {
        output["log_lines"] = entries.size();
    }
    std::cout << output.dump(2) << std::endl;
    return 0;
}

int TetherCli::runLogcat(const QStringList &args)
{
    double lines = kDefaultLogLines;
    if (!parseNumberArg(args, QStringLiteral("--lines"), lines)) {
        return 1;
    }
    if (!requireDevice()) {
        return 1;
    }

    if (args.contains(QStringLiteral("--follow"))) {
        std::unique_ptr<LogCollector> logs = makeLogCollector(*m_platform, m_config);
        if (!logs->start()) {
            return 1;
        }
        qInfo().noquote() << "streaming logs (Ctrl+C to stop)...";
        while (!m_interrupted.load()) {
            printLogEntries(logs->drain());
            std::this_thread::sleep_for(kFollowInterval);
        }
        logs->stop();
        printLogEntries(logs->drain());
        qInfo().noquote() << "stopped";
        return kExitInterrupted;
    }

    const QString output = m_platform->oneShotLogs(static_cast<int>(lines));
    if (output.isEmpty()) {
        std::cout << "log retrieval failed" << std::endl;
        return 1;
    }

    // Feed the dump through an idle collector so one-shot output is filtered
    // and classified exactly like the live stream.
    TetherConfig oneShotConfig = m_config;
    oneShotConfig.logMaxLines = std::max(1, static_cast<int>(lines));
    std::unique_ptr<LogCollector> filter = makeLogCollector(*m_platform, oneShotConfig);
    const QStringList rawLines = output.split(QLatin1Char('\n'));
    for (const QString &line : rawLines) {
        filter->ingestLine(line);
    }
    printLogEntries(filter->drain());
    return 0;
}

int TetherCli::runWatch(const QStringList &args)
{
    WatchOptions options = WatchOptions::fromSettings(m_config.watch);

    double debounceSeconds = m_config.watch.debounceSeconds;
    if (!parseNumberArg(args, QStringLiteral("--debounce"), debounceSeconds)) {
        return 1;
    }
    options.debounce = std::chrono::milliseconds(static_cast<long long>(debounceSeconds * 1000.0));

    if (args.contains(QStringLiteral("--timeout"))) {
        double timeoutSeconds = 0.0;
        if (!parseNumberArg(args, QStringLiteral("--timeout"), timeoutSeconds)) {
            return 1;
        }
        if (timeoutSeconds > 0.0) {
            options.timeout = std::chrono::milliseconds(static_cast<long long>(timeoutSeconds * 1000.0));
        }
    }
    if (args.contains(QStringLiteral("--json"))) {
        options.format = OutputFormat::Json;
    }

    WatchLoop loop(*m_platform,
                   options,
                   makeLogCollector(*m_platform, m_config),
                   m_interrupted,
                   std::cout);
    const WatchOutcome outcome = loop.run();
    if (outcome == WatchOutcome::DeviceUnavailable) {
        std::cout << "Device not running." << std::endl;
    } else if (outcome == WatchOutcome::OutputUnavailable) {
        std::cout << "Cannot write to " << options.targets.outputDir.toStdString() << std::endl;
    } else if (outcome == WatchOutcome::Interrupted) {
        qInfo().noquote() << "stopped";
    }
    return exitCodeFor(outcome);
}

} // namespace tether
