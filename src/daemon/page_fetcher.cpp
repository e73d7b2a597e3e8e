#include "daemon/page_fetcher.hpp"

#include <memory>
#include <optional>

#include <QElapsedTimer>
#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QStringConverter>
#include <QStringDecoder>
#include <QTimer>
#include <QUrl>

#include "common/logging.hpp"

namespace pagewatch {

namespace {

constexpr qint64 kMaxBodyBytes = 16 * 1024 * 1024;

std::optional<QStringConverter::Encoding> charsetFromContentType(const QString &contentType)
{
    const QString marker = QStringLiteral("charset=");
    const qsizetype pos = contentType.indexOf(marker, 0, Qt::CaseInsensitive);
    if (pos < 0) {
        return std::nullopt;
    }
    QString name = contentType.mid(pos + marker.size()).section(QLatin1Char(';'), 0, 0).trimmed();
    name.remove(QLatin1Char('"'));
    name.remove(QLatin1Char('\''));
    if (name.isEmpty()) {
        return std::nullopt;
    }
    return QStringConverter::encodingForName(name.toLatin1().constData());
}

std::string decodeBody(const QByteArray &body, const QString &contentType)
{
    std::optional<QStringConverter::Encoding> encoding = charsetFromContentType(contentType);
    if (!encoding.has_value()) {
        encoding = QStringConverter::encodingForHtml(body);
    }
    QStringDecoder decoder(encoding.value_or(QStringConverter::Utf8));
    const QString decoded = decoder.decode(body);
    return decoded.toStdString();
}

std::string httpFailureText(QNetworkReply &reply, int status)
{
    const QString reason =
        reply.attribute(QNetworkRequest::HttpReasonPhraseAttribute).toString().trimmed();
    QString text = QStringLiteral("HTTP %1").arg(status);
    if (!reason.isEmpty()) {
        text += QLatin1Char(' ') + reason;
    }
    return text.toStdString();
}

} // namespace

FetchResult FetchResult::success(std::string body, std::string contentType, int httpStatus)
{
    FetchResult result;
    result.ok = true;
    result.body = std::move(body);
    result.contentType = std::move(contentType);
    result.httpStatus = httpStatus;
    return result;
}

FetchResult FetchResult::failure(std::string error, int httpStatus)
{
    FetchResult result;
    result.ok = false;
    result.error = std::move(error);
    result.httpStatus = httpStatus;
    return result;
}

HttpPageFetcher::HttpPageFetcher(std::string userAgent, std::chrono::milliseconds timeout)
    : m_userAgent(std::move(userAgent))
    , m_timeout(timeout)
{
}

FetchResult HttpPageFetcher::fetch(const std::string &url) const
{
    const QUrl qurl(QString::fromStdString(url), QUrl::TolerantMode);
    if (!qurl.isValid() || qurl.host().isEmpty()) {
        return FetchResult::failure("invalid url: " + url);
    }
    const QString scheme = qurl.scheme().toLower();
    if (scheme != QStringLiteral("http") && scheme != QStringLiteral("https")) {
        return FetchResult::failure("unsupported url scheme: " + scheme.toStdString());
    }

    QNetworkRequest request(qurl);
    request.setHeader(QNetworkRequest::UserAgentHeader, QString::fromStdString(m_userAgent));
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                         QNetworkRequest::NoLessSafeRedirectPolicy);

    QElapsedTimer elapsed;
    elapsed.start();

    QNetworkAccessManager manager;
    std::unique_ptr<QNetworkReply> reply(manager.get(request));

    bool timedOut = false;
    bool tooLarge = false;
    QEventLoop loop;
    QTimer deadline;
    deadline.setSingleShot(true);
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&deadline, &QTimer::timeout, &loop, [&reply, &timedOut]() {
        timedOut = true;
        reply->abort();
    });
    QObject::connect(reply.get(), &QNetworkReply::downloadProgress, &loop,
                     [&reply, &tooLarge](qint64 received, qint64) {
                         if (received > kMaxBodyBytes && !tooLarge) {
                             tooLarge = true;
                             reply->abort();
                         }
                     });
    deadline.start(m_timeout);
    if (!reply->isFinished()) {
        loop.exec();
    }
    deadline.stop();

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    const QString contentType = reply->header(QNetworkRequest::ContentTypeHeader).toString();

    FetchResult result;
    if (timedOut) {
        result = FetchResult::failure(
            "timed out after " + std::to_string(m_timeout.count()) + " ms", status);
    } else if (tooLarge) {
        result = FetchResult::failure(
            "response exceeds " + std::to_string(kMaxBodyBytes) + " bytes", status);
    } else if (status >= 400) {
        result = FetchResult::failure(httpFailureText(*reply, status), status);
    } else if (reply->error() != QNetworkReply::NoError) {
        result = FetchResult::failure(reply->errorString().toStdString(), status);
    } else {
        result = FetchResult::success(decodeBody(reply->readAll(), contentType),
                                      contentType.toStdString(), status);
    }

    PWLOG_DEBUG(QStringLiteral("HttpPageFetcher"),
                QStringLiteral("fetch"),
                result.ok ? QStringLiteral("fetch_ok") : QStringLiteral("fetch_failed"),
                QStringLiteral("check_cycle"),
                QStringLiteral("http_get"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"url", url},
                                {"status", status},
                                {"bytes", result.body.size()},
                                {"elapsedMs", elapsed.elapsed()},
                                {"error", result.error}}));
    return result;
}

} // namespace pagewatch
