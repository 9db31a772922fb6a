#include "network/response_decoder.hpp"

#include "network/discovery_config.hpp"

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QString>
#include <QStringDecoder>

namespace lanscout::network {
namespace {

using DecodeResult = Result<DeviceRecord, DecodeError>;

DecodeResult malformed(DecodeErrorKind kind, const QString& message) {
    return DecodeResult::err(DecodeError{kind, message.toStdString()});
}

} // namespace

QByteArray encode_probe() {
    return QByteArray(kProbeMessage);
}

bool is_probe_echo(const QByteArray& payload) {
    return payload == QByteArray(kProbeMessage);
}

Result<DeviceRecord, DecodeError> decode_response(const QByteArray& payload,
                                                  const QHostAddress& sender,
                                                  QStringConverter::Encoding encoding) {
    if (payload.isEmpty()) {
        return malformed(DecodeErrorKind::MalformedStructure, QStringLiteral("empty payload"));
    }

    QStringDecoder decoder(encoding, QStringConverter::Flag::Stateless);
    const QString text = decoder.decode(payload);
    if (decoder.hasError()) {
        return malformed(DecodeErrorKind::MalformedEncoding,
                         QStringLiteral("payload is not valid %1 text")
                             .arg(QString::fromLatin1(QStringConverter::nameForEncoding(encoding))));
    }

    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(text.toUtf8(), &err);
    if (err.error != QJsonParseError::NoError) {
        return malformed(DecodeErrorKind::MalformedStructure,
                         QStringLiteral("invalid json at offset %1: %2")
                             .arg(err.offset)
                             .arg(err.errorString()));
    }
    if (!doc.isObject()) {
        return malformed(DecodeErrorKind::MalformedStructure,
                         QStringLiteral("json document is not an object"));
    }

    auto obj = doc.object();
    if (obj.isEmpty()) {
        return malformed(DecodeErrorKind::MalformedStructure,
                         QStringLiteral("json object has no fields"));
    }

    return DecodeResult::ok(DeviceRecord(sender, std::move(obj)));
}

} // namespace lanscout::network
