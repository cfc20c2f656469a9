#ifndef CAMERASETTINGS_H
#define CAMERASETTINGS_H

#include <QSize>
#include <QString>
#include <QVariantMap>

/**
 * @brief Capture settings sent with the Configure action
 *
 * Either value may be left unset; only the set ones are sent.
 */
struct CameraSettings {
    QSize resolution;      // invalid when unset
    double framerate = 0;  // 0 when unset

    bool isEmpty() const { return !resolution.isValid() && framerate <= 0; }
    QVariantMap toParameters() const;

    // "640x480", "1280X720"
    static bool parseResolution(const QString& text, QSize* resolution, QString* errorMessage = nullptr);
    // "30", "29.97", "30000/1001"
    static bool parseFramerate(const QString& text, double* framerate, QString* errorMessage = nullptr);
};

#endif // CAMERASETTINGS_H
