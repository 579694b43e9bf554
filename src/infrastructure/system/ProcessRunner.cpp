#include "infrastructure/system/ProcessRunner.hpp"

#include <QProcess>
#include <QStringList>
#include <spdlog/spdlog.h>

#ifdef Q_OS_WIN
#include <windows.h>
#endif

namespace nettune::infra {

ProcessRunner::ProcessRunner(std::chrono::milliseconds timeout) : timeout_(timeout) {}

core::CommandOutput ProcessRunner::run(const std::string& program,
                                       const std::vector<std::string>& arguments) {
    QStringList args;
    for (const auto& argument : arguments) {
        args << QString::fromStdString(argument);
    }

    QProcess process;
#ifdef Q_OS_WIN
    process.setCreateProcessArgumentsModifier(
        [](QProcess::CreateProcessArguments* cpa) { cpa->flags |= CREATE_NO_WINDOW; });
#endif
    process.start(QString::fromStdString(program), args);

    core::CommandOutput output;
    if (!process.waitForStarted(static_cast<int>(timeout_.count()))) {
        output.standardError = process.errorString().toStdString();
        return output;
    }
    output.started = true;

    if (!process.waitForFinished(static_cast<int>(timeout_.count()))) {
        spdlog::warn("'{}' did not finish within {}ms, killing it", program, timeout_.count());
        process.kill();
        process.waitForFinished(1000);
        output.standardOutput = QString::fromLocal8Bit(process.readAllStandardOutput()).toStdString();
        output.standardError = "timed out after " + std::to_string(timeout_.count()) + " ms";
        return output;
    }

    output.standardOutput = QString::fromLocal8Bit(process.readAllStandardOutput()).toStdString();
    output.standardError = QString::fromLocal8Bit(process.readAllStandardError()).toStdString();
    output.exitCode = process.exitStatus() == QProcess::NormalExit ? process.exitCode() : -1;
    return output;
}

} // namespace nettune::infra
