#include "TerminalRenderer.hpp"

#include <QLocale>
#include <QLoggingCategory>
#include <QString>
#include <cstdio>
Q_LOGGING_CATEGORY(ocCopy, "opencopy.copy")

static QString speedText(double bytesPerSec) {
    if (bytesPerSec <= 0.0)
        return QStringLiteral("--");
    return QLocale::system().formattedDataSize(qint64(bytesPerSec)) +
           QStringLiteral("/s");
}

TerminalRenderer::TerminalRenderer(bool interactive, bool quiet)
    : err_(stderr, QIODevice::WriteOnly), interactive_(interactive), quiet_(quiet) {}

void TerminalRenderer::render(const opencopy::ProgressSnapshot& snapshot) {
    if (quiet_)
        return;
    bars_[snapshot.barId] = snapshot;
    // Multi-file batches send the overall bar first; draw once the nested
    // file bar arrives so each update produces a single line.
    if (snapshot.parentBarId.has_value() || bars_.size() == 1) {
        if (interactive_ || snapshot.completed)
            drawLine();
    }
    if (snapshot.completed) {
        bars_.erase(snapshot.barId);
        if (bars_.empty())
            closeLine();
    }
}

void TerminalRenderer::drawLine() {
    QString line;
    const auto overall = bars_.find(opencopy::ProgressReporter::kOverallBarId);
    const auto file = bars_.find(opencopy::ProgressReporter::kFileBarId);
    if (file != bars_.end() && overall != bars_.end()) {
        line = QStringLiteral("[%1%] %2 | %3 %4%")
                   .arg(overall->second.overallPercent, 3)
                   .arg(QString::fromStdString(overall->second.overallStatusText))
                   .arg(QString::fromStdString(file->second.currentFileName))
                   .arg(file->second.filePercent);
    } else if (overall != bars_.end()) {
        line = QStringLiteral("[%1%] %2 %3")
                   .arg(overall->second.overallPercent, 3)
                   .arg(QString::fromStdString(overall->second.currentFileName))
                   .arg(speedText(overall->second.speedBytesPerSec));
    } else {
        return;
    }
    if (interactive_) {
        err_ << '\r' << line << QStringLiteral("\x1b[K");
        lineOpen_ = true;
    } else {
        err_ << line << '\n';
    }
    err_.flush();
}

void TerminalRenderer::closeLine() {
    if (lineOpen_) {
        err_ << '\n';
        err_.flush();
        lineOpen_ = false;
    }
}

void TerminalRenderer::issue(const opencopy::CopyIssue& issue) {
    closeLine();
    QString msg = QString::fromStdString(issue.message);
    if (issue.osError != 0)
        msg += QStringLiteral(" [errno %1]").arg(issue.osError);
    if (issue.kind == opencopy::CopyIssueKind::SizeCalculation) {
        qCCritical(ocCopy).noquote()
            << opencopy::issueKindName(issue.kind) << msg;
        return;
    }
    qCWarning(ocCopy).noquote() << opencopy::issueKindName(issue.kind) << msg;
}

void TerminalRenderer::debug(const std::string& message) {
    qCDebug(ocCopy).noquote() << QString::fromStdString(message);
}

void TerminalRenderer::finished(const opencopy::CopyReport& report) {
    closeLine();
    qCInfo(ocCopy) << "batch finished"
                   << "completed=" << qulonglong(report.filesCompleted)
                   << "skipped=" << qulonglong(report.filesSkipped)
                   << "failed=" << qulonglong(report.filesFailed)
                   << "bytes=" << qulonglong(report.bytesCopied)
                   << "cancelled=" << report.cancelled
                   << "native=" << report.nativeUsed;
    err_ << QString::fromStdString(report.summaryLine()) << '\n';
    err_.flush();
}
