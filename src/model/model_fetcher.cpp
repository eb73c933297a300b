#include "tile_segment/model/model_fetcher.hpp"
#include "tile_segment/core/errors.hpp"

#include <QCoreApplication>
#include <QEventLoop>
#include <QFile>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QUrl>

namespace tile_segment::model {

HttpModelFetcher::HttpModelFetcher(int timeout_ms) : timeout_ms_(timeout_ms) {}

void HttpModelFetcher::fetch(const std::string& url, const fs::path& dest,
                             const DownloadProgress& progress) {
    if (!QCoreApplication::instance()) {
        throw IOError("Cannot download " + url + ": no QCoreApplication");
    }

    std::error_code ec;
    fs::create_directories(dest.parent_path(), ec);
    if (ec) {
        throw IOError("Cannot create directory " + dest.parent_path().string() + ": " + ec.message());
    }

    const fs::path part = dest.string() + ".part";
    QFile file(QString::fromStdString(part.string()));
    if (!file.open(QIODevice::WriteOnly)) {
        throw IOError("Cannot open file for writing: " + part.string());
    }

    QNetworkAccessManager nam;
    QNetworkRequest request(QUrl(QString::fromStdString(url)));
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                         QNetworkRequest::NoLessSafeRedirectPolicy);
    request.setHeader(QNetworkRequest::UserAgentHeader, "TileSegment/1.0");
    if (timeout_ms_ > 0) {
        request.setTransferTimeout(timeout_ms_);
    }

    QNetworkReply* reply = nam.get(request);
    bool write_failed = false;

    QEventLoop loop;
    QObject::connect(reply, &QNetworkReply::readyRead, [&]() {
        const QByteArray chunk = reply->readAll();
        if (file.write(chunk) != chunk.size()) {
            write_failed = true;
            reply->abort();
        }
    });
    if (progress) {
        QObject::connect(reply, &QNetworkReply::downloadProgress,
                         [&](qint64 received, qint64 total) { progress(received, total); });
    }
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    loop.exec();

    const bool ok = !write_failed && reply->error() == QNetworkReply::NoError;
    const std::string error_text = reply->errorString().toStdString();
    if (ok) {
        file.write(reply->readAll());
    }
    file.close();
    reply->deleteLater();

    if (!ok) {
        fs::remove(part, ec);
        if (write_failed) {
            throw IOError("Cannot write " + part.string() + " while downloading " + url);
        }
        throw IOError("Download failed for " + url + ": " + error_text);
    }

    fs::rename(part, dest, ec);
    if (ec) {
        fs::remove(part, ec);
        throw IOError("Cannot move download into place: " + dest.string());
    }
}

} // namespace tile_segment::model
