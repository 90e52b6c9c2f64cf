// Application entry point: read settings, pick the SFTP backend and show MainWindow.
#include <QApplication>
#include <QSettings>
#include <cstdlib>
#include <cstring>
#include "MainWindow.hpp"
#include "datadrift/Libssh2SftpClient.hpp"
#include "datadrift/Log.hpp"
#include "datadrift/MockSftpClient.hpp"

static datadrift::TransferOptions transferOptionsFromSettings(const QSettings& s) {
    datadrift::TransferOptions o;
    o.workers = qBound(1, s.value("Transfer/workers", o.workers).toInt(), 16);
    o.chunk_bytes = (std::size_t)qBound(4, s.value("Transfer/chunkKiB", (int)(o.chunk_bytes / 1024)).toInt(), 4096) * 1024;
    o.max_edit_bytes = (std::uint64_t)qMax(1, s.value("Transfer/maxEditKiB", (int)(o.max_edit_bytes / 1024)).toInt()) * 1024;
    o.speed_limit_kbps = qMax(0, s.value("Transfer/speedLimitKBps", o.speed_limit_kbps).toInt());
    o.retention_sec = qMax(0, s.value("Transfer/retentionSec", o.retention_sec).toInt());
    o.max_attempts = qMax(1, s.value("Transfer/maxAttempts", o.max_attempts).toInt());
    return o;
}

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    QCoreApplication::setApplicationName("DataDrift");
    QCoreApplication::setOrganizationName("DataDrift");

    QSettings s("DataDrift", "DataDrift");
    const datadrift::TransferOptions topt = transferOptionsFromSettings(s);

    datadrift::SessionManager::ClientFactory factory;
    const char* mock = std::getenv("DATADRIFT_MOCK");
    if (mock && std::strcmp(mock, "1") == 0) {
        // Demo mode: an in-memory tree accepting any user without a password list
        auto fs = datadrift::MockRemoteFs::demo();
        factory = [fs] { return std::make_unique<datadrift::MockSftpClient>(fs); };
        LOGI("using the in-memory demo backend");
    } else {
        factory = [] { return std::make_unique<datadrift::Libssh2SftpClient>(); };
    }

    MainWindow w(std::move(factory), topt);
    w.show();
    return app.exec();
}
