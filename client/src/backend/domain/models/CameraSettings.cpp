#include "backend/domain/models/CameraSettings.h"
#include <QStringList>
#include <QtNumeric>

QVariantMap CameraSettings::toParameters() const {
    QVariantMap parameters;
    if (resolution.isValid()) {
        parameters.insert("resolution", resolution);
    }
    if (framerate > 0) {
        parameters.insert("framerate", framerate);
    }
    return parameters;
}

bool CameraSettings::parseResolution(const QString& text, QSize* resolution, QString* errorMessage) {
    const QStringList parts = text.trimmed().toLower().split('x');
    bool widthOk = false;
    bool heightOk = false;
    const int width = parts.size() == 2 ? parts.at(0).toInt(&widthOk) : 0;
    const int height = parts.size() == 2 ? parts.at(1).toInt(&heightOk) : 0;
    if (!widthOk || !heightOk || width <= 0 || height <= 0) {
        if (errorMessage) *errorMessage = QString("Invalid resolution \"%1\"").arg(text.trimmed());
        return false;
    }
    if (resolution) *resolution = QSize(width, height);
    return true;
}

bool CameraSettings::parseFramerate(const QString& text, double* framerate, QString* errorMessage) {
    const QString trimmed = text.trimmed();
    double value = 0;
    bool ok = false;
    if (trimmed.contains('/')) {
        const QStringList parts = trimmed.split('/');
        bool numOk = false;
        bool denOk = false;
        const qlonglong numerator = parts.size() == 2 ? parts.at(0).toLongLong(&numOk) : 0;
        const qlonglong denominator = parts.size() == 2 ? parts.at(1).toLongLong(&denOk) : 0;
        ok = numOk && denOk && denominator != 0;
        if (ok) value = static_cast<double>(numerator) / static_cast<double>(denominator);
    } else {
        value = trimmed.toDouble(&ok);
    }
    if (!ok || !qIsFinite(value) || value <= 0) {
        if (errorMessage) *errorMessage = QString("Invalid framerate \"%1\"").arg(trimmed);
        return false;
    }
    if (framerate) *framerate = value;
    return true;
}
