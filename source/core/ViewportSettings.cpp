#include "ViewportSettings.h"

#include <QDebug>
#include <QSettings>
#include <cmath>

namespace {

const char* const SETTINGS_GROUP = "viewport";

bool isPositive(qreal v) { return std::isfinite(v) && v > 0; }
bool isNonNegative(qreal v) { return std::isfinite(v) && v >= 0; }

template <typename T, typename Pred>
int repair(T& value, T fallback, Pred valid, const char* key)
{
    if (valid(value)) {
        return 0;
    }
    qWarning() << "ViewportSettings: invalid" << key << "=" << value << "- using default" << fallback;
    value = fallback;
    return 1;
}

} // namespace

ViewportSettings ViewportSettings::load(QSettings& settings)
{
    const ViewportSettings d;
    ViewportSettings s;

    settings.beginGroup(SETTINGS_GROUP);
    s.minScale = settings.value("minScale", d.minScale).toReal();
    s.maxScale = settings.value("maxScale", d.maxScale).toReal();
    s.enablePan = settings.value("enablePan", d.enablePan).toBool();
    s.enableZoom = settings.value("enableZoom", d.enableZoom).toBool();
    s.pageWidth = settings.value("pageWidth", d.pageWidth).toReal();
    s.pageHeight = settings.value("pageHeight", d.pageHeight).toReal();
    s.pageMargin = settings.value("pageMargin", d.pageMargin).toReal();
    s.scrollGutter = settings.value("scrollGutter", d.scrollGutter).toReal();
    s.fitPadding = settings.value("fitPadding", d.fitPadding).toReal();
    s.deviationEpsilon = settings.value("deviationEpsilon", d.deviationEpsilon).toReal();
    s.nudgeThreshold = settings.value("nudgeThreshold", d.nudgeThreshold).toInt();
    s.nudgeWindowMs = settings.value("nudgeWindowMs", d.nudgeWindowMs).toInt();
    s.significanceEpsilon = settings.value("significanceEpsilon", d.significanceEpsilon).toReal();
    s.wheelBaseSensitivity = settings.value("wheelBaseSensitivity", d.wheelBaseSensitivity).toReal();
    s.keyboardBaseStep = settings.value("keyboardBaseStep", d.keyboardBaseStep).toReal();
    s.resizeDebounceMs = settings.value("resizeDebounceMs", d.resizeDebounceMs).toInt();
    s.fitAnimationMs = settings.value("fitAnimationMs", d.fitAnimationMs).toInt();
    settings.endGroup();

    s.sanitize();
    return s;
}

ViewportSettings ViewportSettings::load()
{
    QSettings settings("FolioView", "App");
    return load(settings);
}

void ViewportSettings::save(QSettings& settings) const
{
    settings.beginGroup(SETTINGS_GROUP);
    settings.setValue("minScale", minScale);
    settings.setValue("maxScale", maxScale);
    settings.setValue("enablePan", enablePan);
    settings.setValue("enableZoom", enableZoom);
    settings.setValue("pageWidth", pageWidth);
    settings.setValue("pageHeight", pageHeight);
    settings.setValue("pageMargin", pageMargin);
    settings.setValue("scrollGutter", scrollGutter);
    settings.setValue("fitPadding", fitPadding);
    settings.setValue("deviationEpsilon", deviationEpsilon);
    settings.setValue("nudgeThreshold", nudgeThreshold);
    settings.setValue("nudgeWindowMs", nudgeWindowMs);
    settings.setValue("significanceEpsilon", significanceEpsilon);
    settings.setValue("wheelBaseSensitivity", wheelBaseSensitivity);
    settings.setValue("keyboardBaseStep", keyboardBaseStep);
    settings.setValue("resizeDebounceMs", resizeDebounceMs);
    settings.setValue("fitAnimationMs", fitAnimationMs);
    settings.endGroup();
}

void ViewportSettings::save() const
{
    QSettings settings("FolioView", "App");
    save(settings);
}

int ViewportSettings::sanitize()
{
    const ViewportSettings d;
    int replaced = 0;

    replaced += repair(minScale, d.minScale, isPositive, "minScale");
    replaced += repair(maxScale, d.maxScale, isPositive, "maxScale");
    if (minScale > maxScale) {
        qWarning() << "ViewportSettings: minScale" << minScale << "exceeds maxScale" << maxScale
                   << "- using defaults";
        minScale = d.minScale;
        maxScale = d.maxScale;
        replaced += 2;
    }

    replaced += repair(pageWidth, d.pageWidth, isPositive, "pageWidth");
    replaced += repair(pageHeight, d.pageHeight, isPositive, "pageHeight");
    replaced += repair(pageMargin, d.pageMargin, isNonNegative, "pageMargin");
    replaced += repair(scrollGutter, d.scrollGutter, isNonNegative, "scrollGutter");
    replaced += repair(fitPadding, d.fitPadding, isNonNegative, "fitPadding");
    replaced += repair(deviationEpsilon, d.deviationEpsilon, isPositive, "deviationEpsilon");
    replaced += repair(significanceEpsilon, d.significanceEpsilon, isPositive, "significanceEpsilon");
    replaced += repair(wheelBaseSensitivity, d.wheelBaseSensitivity, isPositive, "wheelBaseSensitivity");
    replaced += repair(keyboardBaseStep, d.keyboardBaseStep, isPositive, "keyboardBaseStep");

    auto positiveInt = [](int v) { return v > 0; };
    auto nonNegativeInt = [](int v) { return v >= 0; };
    replaced += repair(nudgeThreshold, d.nudgeThreshold, positiveInt, "nudgeThreshold");
    replaced += repair(nudgeWindowMs, d.nudgeWindowMs, nonNegativeInt, "nudgeWindowMs");
    replaced += repair(resizeDebounceMs, d.resizeDebounceMs, nonNegativeInt, "resizeDebounceMs");
    replaced += repair(fitAnimationMs, d.fitAnimationMs, nonNegativeInt, "fitAnimationMs");

    return replaced;
}

CameraConstraints ViewportSettings::constraints() const
{
    CameraConstraints c;
    c.minScale = minScale;
    c.maxScale = maxScale;
    c.enablePan = enablePan;
    c.enableZoom = enableZoom;
    return c;
}

FitConfig ViewportSettings::fitConfig() const
{
    FitConfig c;
    c.fitPadding = fitPadding;
    c.deviationEpsilon = deviationEpsilon;
    c.nudgeThreshold = nudgeThreshold;
    c.nudgeWindowMs = nudgeWindowMs;
    c.animationMs = fitAnimationMs;
    return c;
}
