// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "mapview/Viewport.hpp"

#include "mapview/MapViewConstants.hpp"
#include "utils/Macros.hpp"

#include <QtCore/QDebug>

#include <algorithm>
#include <cmath>
#include <limits>

namespace MapView {

namespace {

// Pushes the shared animate/duration settings down into zoom and pan.
ZoomPanOptions resolved(ZoomPanOptions options)
{
    if (options.animate.has_value()) {
        if (!options.zoom.animate.has_value())
            options.zoom.animate = options.animate;
        if (!options.pan.animate.has_value())
            options.pan.animate = options.animate;
        if (!options.pan.duration.has_value())
            options.pan.duration = options.duration;
    }
    return options;
}

double rebound(double left, double right)
{
    if (left + right > 0.0)
        return Geometry::roundHalfUp(left - right) / 2.0;
    return std::max(0.0, std::ceil(left)) - std::max(0.0, std::floor(right));
}

} // namespace

Viewport::Viewport(Api::IFrameClock* clock,
                   const Geometry::Point& size,
                   const Geo::LatLng& center,
                   double zoom,
                   ViewportOptions options,
                   QObject* parent)
    : QObject(parent)
    , m_clock(clock)
    , m_options(std::move(options))
    , m_size(size)
    , m_panAnim(clock)
    , m_resizeMoveEndTimer(clock)
{
    if (!m_options.crs)
        m_options.crs = Geo::Crs::epsg3857();

    connect(&m_panAnim, &PosAnimation::stepped, this, [this](const Geometry::Point& pos) {
        m_panePos = pos;
        emit moved(MoveEvent{});
    });
    connect(&m_panAnim, &PosAnimation::finished, this, [this] { emit moveEnded(); });

    if (m_options.transform3DLimit > 0.0)
        connect(this, &Viewport::moveEnded, this, &Viewport::checkTransformLimit);

    if (m_options.maxBounds.isValid())
        m_maxBoundsConnection = connect(this, &Viewport::moveEnded, this, &Viewport::panInsideMaxBounds);

    m_zoom = limitZoom(zoom);
    const Geo::LatLng limited = limitCenter(center, m_zoom, m_options.maxBounds);
    m_lastCenter = limited;
    m_pixelOrigin = newPixelOrigin(limited, m_zoom);

    qCDebug(mapviewlog).noquote() << "Viewport created," << m_options.crs->code() << "zoom" << m_zoom;
}

Viewport::~Viewport()
{
    if (m_zoomFrame != 0)
        m_clock->cancelFrame(m_zoomFrame);
    if (m_flyFrame != 0)
        m_clock->cancelFrame(m_flyFrame);
}

// ---- State ----

Geo::LatLng Viewport::center() const
{
    if (m_lastCenter && !paneMoved())
        return *m_lastCenter;
    return layerPointToLatLng(centerLayerPoint());
}

double Viewport::animationTargetZoom() const
{
    return m_zoomAnim ? m_zoomAnim->targetZoom : m_zoom;
}

Geo::LatLng Viewport::animationTargetCenter() const
{
    return m_zoomAnim ? m_zoomAnim->targetCenter : center();
}

// ---- View changes ----

void Viewport::setView(const Geo::LatLng& center, double zoom, ZoomPanOptions options)
{
    zoom = limitZoom(zoom);
    const Geo::LatLng limited = limitCenter(center, zoom, m_options.maxBounds);

    stopAnimations();

    options = resolved(std::move(options));
    const bool animated = (m_zoom != zoom) ? tryAnimatedZoom(limited, zoom, options.zoom)
                                           : tryAnimatedPan(limited, options.pan);
    if (animated) {
        // The view refreshes when the animation ends.
        m_resizeMoveEndTimer.cancel();
        return;
    }

    resetView(limited, zoom);
}

void Viewport::setZoom(double zoom, const ZoomOptions& options)
{
    ZoomPanOptions viewOptions;
    viewOptions.zoom = options;
    setView(center(), zoom, viewOptions);
}

void Viewport::zoomIn(std::optional<double> delta, const ZoomOptions& options)
{
    setZoom(m_zoom + delta.value_or(m_options.zoomDelta), options);
}

void Viewport::zoomOut(std::optional<double> delta, const ZoomOptions& options)
{
    setZoom(m_zoom - delta.value_or(m_options.zoomDelta), options);
}

void Viewport::setZoomAround(const Geometry::Point& containerPoint, double zoom, const ZoomOptions& options)
{
    const double scale = zoomScale(zoom);
    const Geometry::Point viewHalf = m_size / 2.0;
    const Geometry::Point offset = (containerPoint - viewHalf) * (1.0 - 1.0 / scale);
    const Geo::LatLng newCenter = containerPointToLatLng(viewHalf + offset);

    ZoomPanOptions viewOptions;
    viewOptions.zoom = options;
    setView(newCenter, zoom, viewOptions);
}

void Viewport::setZoomAround(const Geo::LatLng& anchor, double zoom, const ZoomOptions& options)
{
    setZoomAround(latLngToContainerPoint(anchor), zoom, options);
}

Utils::Result Viewport::fitBounds(const Geo::LatLngBounds& bounds, const FitBoundsOptions& options)
{
    UTILS_GUARD_OK(bounds.isValid(), QStringLiteral("Bounds are not valid"));

    const CenterZoom target = boundsCenterZoom(bounds, options);
    UTILS_GUARD_OK(std::isfinite(target.zoom),
                   QStringLiteral("Bounds have no extent and the maximum zoom is unbounded"));

    setView(target.center, target.zoom, options.view);
    return Utils::Result::success();
}

Utils::Result Viewport::fitWorld(const FitBoundsOptions& options)
{
    return fitBounds(Geo::LatLngBounds(Geo::LatLng(-90.0, -180.0), Geo::LatLng(90.0, 180.0)), options);
}

void Viewport::panTo(const Geo::LatLng& center, const PanOptions& options)
{
    ZoomPanOptions viewOptions;
    viewOptions.pan = options;
    setView(center, m_zoom, viewOptions);
}

void Viewport::panBy(const Geometry::Point& offset, const PanOptions& options)
{
    const Geometry::Point rounded = offset.rounded();
    if (rounded.isNull()) {
        emit moveEnded();
        return;
    }

    // Jumping further than one view would leave nothing on screen to animate.
    if (options.animate != true && !m_size.contains(rounded)) {
        stopAnimations();
        resetView(unproject(project(center()) + rounded), m_zoom);
        return;
    }

    if (m_fly || m_zoomAnim)
        stopAnimations();

    if (!options.noMoveStart)
        emit moveStarted();

    if (options.animate != false) {
        const double duration = options.duration.value_or(0.0) > 0.0 ? *options.duration
                                                                      : Constants::kPanDurationSec;
        m_panAnim.run(m_panePos, (m_panePos - rounded).rounded(), duration, options.easeLinearity);
        return;
    }

    m_panAnim.stop();
    rawPanBy(rounded);
    emit moved(MoveEvent{});
    emit moveEnded();
}

void Viewport::panInside(const Geo::LatLng& latlng, const FitBoundsOptions& options)
{
    const Geometry::Point paddingTL = options.paddingTopLeft.value_or(options.padding);
    const Geometry::Point paddingBR = options.paddingBottomRight.value_or(options.padding);
    Geometry::Point pixelCenter = project(center());
    const Geometry::Point pixelPoint = project(latlng);
    const Geometry::Bounds view = pixelBounds();
    Geometry::Bounds padded(view.min() + paddingTL, view.max() - paddingBR);
    const Geometry::Point paddedSize = padded.size();

    UTILS_GUARD(!padded.contains(pixelPoint));

    const Utils::ScopedAssign<bool> enforcing(m_enforcingBounds, true);

    const Geometry::Point direction = pixelPoint - padded.center();
    const Geometry::Point offset = padded.extend(pixelPoint).size() - paddedSize;
    pixelCenter.x += direction.x < 0.0 ? -offset.x : offset.x;
    pixelCenter.y += direction.y < 0.0 ? -offset.y : offset.y;

    panTo(unproject(pixelCenter), options.view.pan);
}

void Viewport::panInsideBounds(const Geo::LatLngBounds& bounds, const PanOptions& options)
{
    const Utils::ScopedAssign<bool> enforcing(m_enforcingBounds, true);

    const Geo::LatLng current = center();
    const Geo::LatLng limited = limitCenter(current, m_zoom, bounds);
    if (!current.equals(limited))
        panTo(limited, options);
}

void Viewport::flyTo(const Geo::LatLng& center, std::optional<double> zoom, const FlyToOptions& options)
{
    stopAnimations();

    const double startZoom = m_zoom;
    const double targetZoom = zoom ? limitZoom(*zoom) : startZoom;
    const Geo::LatLng targetCenter = limitCenter(center, targetZoom, m_options.maxBounds);

    const Geometry::Point from = project(this->center());
    const Geometry::Point to = project(targetCenter);
    const double w0 = std::max(m_size.x, m_size.y);
    const double w1 = w0 * zoomScale(startZoom, targetZoom);
    FlyToPath path(w0, w1, to.distanceTo(from));

    const double durationMs = options.duration ? 1000.0 * *options.duration
                                               : 1000.0 * path.length() * Constants::kFlyToDurationPerUnit;

    m_fly = FlyAnimation{path, from, to, startZoom, targetCenter, targetZoom, m_clock->now(), durationMs};

    qCDebug(mapviewlog) << "Flying to" << targetCenter << "zoom" << targetZoom << "over" << durationMs << "ms";

    moveStart(true, options.noMoveStart);
    stepFlyTo();
}

Utils::Result Viewport::flyToBounds(const Geo::LatLngBounds& bounds, const FitBoundsOptions& options)
{
    UTILS_GUARD_OK(bounds.isValid(), QStringLiteral("Bounds are not valid"));

    const CenterZoom target = boundsCenterZoom(bounds, options);
    UTILS_GUARD_OK(std::isfinite(target.zoom),
                   QStringLiteral("Bounds have no extent and the maximum zoom is unbounded"));

    FlyToOptions flyOptions;
    flyOptions.duration = options.view.duration;
    flyTo(target.center, target.zoom, flyOptions);
    return Utils::Result::success();
}

void Viewport::setMaxBounds(const Geo::LatLngBounds& bounds)
{
    if (m_maxBoundsConnection)
        disconnect(m_maxBoundsConnection);
    m_maxBoundsConnection = {};

    if (!bounds.isValid()) {
        m_options.maxBounds = Geo::LatLngBounds();
        return;
    }

    m_options.maxBounds = bounds;
    panInsideMaxBounds();
    m_maxBoundsConnection = connect(this, &Viewport::moveEnded, this, &Viewport::panInsideMaxBounds);
}

void Viewport::setMinZoom(double zoom)
{
    UTILS_GUARD(zoom != m_options.minZoom);

    m_options.minZoom = zoom;
    emit zoomLimitsChanged();

    if (m_zoom < zoom)
        setZoom(zoom);
}

void Viewport::setMaxZoom(double zoom)
{
    UTILS_GUARD(zoom != m_options.maxZoom);

    m_options.maxZoom = zoom;
    emit zoomLimitsChanged();

    if (m_zoom > zoom)
        setZoom(zoom);
}

void Viewport::invalidateSize(const Geometry::Point& newSize, const InvalidateSizeOptions& options)
{
    const Geometry::Point oldSize = m_size;
    UTILS_GUARD(oldSize != newSize);

    m_size = newSize;
    m_lastCenter.reset();

    const Geometry::Point offset = (oldSize / 2.0).rounded() - (newSize / 2.0).rounded();
    if (!offset.isNull()) {
        if (options.animate && options.pan) {
            panBy(offset);
        } else {
            if (options.pan)
                rawPanBy(offset);

            emit moved(MoveEvent{});

            if (options.debounceMoveEnd)
                m_resizeMoveEndTimer.start(Constants::kResizeMoveEndDebounceMs, [this] { emit moveEnded(); });
            else
                emit moveEnded();
        }
    }

    emit resized(oldSize, newSize);
}

void Viewport::stop()
{
    stopAnimations();

    const double snapped = limitZoom(m_zoom);
    if (snapped != m_zoom)
        setZoom(snapped);
    else if (m_options.zoomSnap == 0.0)
        emit viewReset();
}

// ---- Animations ----

void Viewport::stopAnimations()
{
    if (m_flyFrame != 0) {
        m_clock->cancelFrame(m_flyFrame);
        m_flyFrame = 0;
    }
    m_fly.reset();

    m_panAnim.stop();

    if (m_zoomAnim)
        finishZoomAnimation();
}

bool Viewport::tryAnimatedPan(const Geo::LatLng& center, const PanOptions& options)
{
    const Geometry::Point offset = centerOffset(center).truncated();
    if (options.animate != true && !m_size.contains(offset))
        return false;

    panBy(offset, options);
    return true;
}

bool Viewport::tryAnimatedZoom(const Geo::LatLng& center, double zoom, const ZoomOptions& options)
{
    if (!m_options.zoomAnimation || options.animate == false
        || std::abs(zoom - m_zoom) > m_options.zoomAnimationThreshold) {
        return false;
    }

    const double scale = zoomScale(zoom);
    const Geometry::Point offset = centerOffset(center) / (1.0 - 1.0 / scale);
    if (options.animate != true && !m_size.contains(offset))
        return false;

    startZoomAnimation(center, zoom, offset);
    return true;
}

void Viewport::startZoomAnimation(const Geo::LatLng& center, double zoom, const Geometry::Point& offset)
{
    ZoomAnimation anim;
    anim.targetCenter = center;
    anim.targetZoom = zoom;
    anim.startZoom = m_zoom;
    anim.scale = zoomScale(zoom);
    anim.startPixelOrigin = m_pixelOrigin;
    anim.pivot = m_size / 2.0 + offset;
    anim.startTime = m_clock->now();
    anim.zoomChanged = m_zoom != zoom;
    m_zoomAnim = anim;

    moveStart(true, false);
    emit zoomAnimated(ZoomAnimEvent{center, zoom, false, anim.scale});

    // The view already answers queries for the target; listeners only hear
    // about the move once the animation commits.
    move(center, zoom, MoveEvent{}, true);

    m_zoomFrame = m_clock->requestFrame([this] { stepZoomAnimation(); });
}

void Viewport::stepZoomAnimation()
{
    m_zoomFrame = 0;
    UTILS_GUARD(m_zoomAnim);

    const double elapsed = static_cast<double>(m_clock->now() - m_zoomAnim->startTime);
    const double t = elapsed / Constants::kZoomAnimationMs;
    if (t >= 1.0) {
        finishZoomAnimation();
        return;
    }

    m_zoomFrame = m_clock->requestFrame([this] { stepZoomAnimation(); });

    const ZoomAnimation& anim = *m_zoomAnim;
    const double eased = 1.0 - std::pow(1.0 - t, Constants::kZoomAnimationEasePower);
    const double frameScale = 1.0 + (anim.scale - 1.0) * eased;
    const Geometry::Point viewHalf = m_size / 2.0;
    const Geometry::Point frameCenterPoint = anim.pivot + (viewHalf - anim.pivot) / frameScale;

    ZoomAnimEvent event;
    event.center = unproject(anim.startPixelOrigin + containerPointToLayerPoint(frameCenterPoint), anim.startZoom);
    event.zoom = scaleZoom(frameScale, anim.startZoom);
    event.scale = frameScale;
    emit zoomAnimationStepped(event);
}

void Viewport::finishZoomAnimation()
{
    UTILS_GUARD(m_zoomAnim);

    if (m_zoomFrame != 0) {
        m_clock->cancelFrame(m_zoomFrame);
        m_zoomFrame = 0;
    }

    const ZoomAnimation anim = *m_zoomAnim;
    m_zoomAnim.reset();

    move(anim.targetCenter, anim.targetZoom, MoveEvent{}, true);

    if (anim.zoomChanged)
        emit zoomed(MoveEvent{});
    emit moved(MoveEvent{});
    moveEnd(true);
}

void Viewport::stepFlyTo()
{
    m_flyFrame = 0;
    UTILS_GUARD(m_fly);

    const FlyAnimation& fly = *m_fly;
    const double t = fly.durationMs > 0.0
                         ? static_cast<double>(m_clock->now() - fly.startTime) / fly.durationMs
                         : 2.0;

    if (t <= 1.0) {
        m_flyFrame = m_clock->requestFrame([this] { stepFlyTo(); });

        const double s = (1.0 - std::pow(1.0 - t, Constants::kFlyToEasePower)) * fly.path.length();
        const Geometry::Point travelled = (fly.to - fly.from) * (fly.path.distance(s) / fly.path.u1());
        const Geo::LatLng frameCenter = unproject(fly.from + travelled, fly.startZoom);
        const double frameZoom = scaleZoom(fly.path.w0() / fly.path.width(s), fly.startZoom);
        move(frameCenter, frameZoom, MoveEvent{true});
        return;
    }

    const Geo::LatLng target = fly.targetCenter;
    const double targetZoom = fly.targetZoom;
    m_fly.reset();

    move(target, targetZoom);
    moveEnd(true);
}

// ---- Core moves ----

void Viewport::resetView(const Geo::LatLng& center, double zoom)
{
    m_panePos = Geometry::Point();
    zoom = limitZoom(zoom);

    emit viewPreReset();

    const bool zoomChanged = m_zoom != zoom;
    moveStart(zoomChanged, false);
    move(center, zoom);
    moveEnd(zoomChanged);

    emit viewReset();
}

void Viewport::move(const Geo::LatLng& center, double zoom, const MoveEvent& event, bool suppressEvents)
{
    const bool zoomChanged = m_zoom != zoom;

    m_zoom = zoom;
    m_lastCenter = center;
    m_pixelOrigin = newPixelOrigin(center, zoom);

    UTILS_GUARD(!suppressEvents);

    if (zoomChanged)
        emit zoomed(event);
    emit moved(event);
}

void Viewport::moveStart(bool zoomChanged, bool noMoveStart)
{
    if (zoomChanged)
        emit zoomStarted();
    if (!noMoveStart)
        emit moveStarted();
}

void Viewport::moveEnd(bool zoomChanged)
{
    if (zoomChanged)
        emit zoomEnded();
    emit moveEnded();
}

void Viewport::rawPanBy(const Geometry::Point& offset)
{
    m_panePos -= offset;
}

void Viewport::panInsideMaxBounds()
{
    if (!m_enforcingBounds)
        panInsideBounds(m_options.maxBounds);
}

void Viewport::checkTransformLimit()
{
    const double extent = std::max(std::abs(m_panePos.x), std::abs(m_panePos.y));
    if (extent >= m_options.transform3DLimit) {
        qCDebug(mapviewlog) << "Pane offset" << m_panePos << "exceeds the transform limit, resetting view";
        resetView(center(), m_zoom);
    }
}

// ---- Limits ----

double Viewport::limitZoom(double zoom) const
{
    if (m_options.zoomSnap != 0.0)
        zoom = Geometry::roundHalfUp(zoom / m_options.zoomSnap) * m_options.zoomSnap;
    return std::max(m_options.minZoom, std::min(m_options.maxZoom, zoom));
}

Geo::LatLng Viewport::limitCenter(const Geo::LatLng& center, double zoom, const Geo::LatLngBounds& bounds) const
{
    UTILS_GUARD_RET(bounds.isValid(), center);

    const Geometry::Point centerPoint = project(center, zoom);
    const Geometry::Point viewHalf = m_size / 2.0;
    const Geometry::Bounds viewBounds(centerPoint - viewHalf, centerPoint + viewHalf);
    const Geometry::Point offset = boundsOffset(viewBounds, bounds, zoom);

    // Sub-pixel corrections would make the view jitter.
    if (std::abs(offset.x) <= 1.0 && std::abs(offset.y) <= 1.0)
        return center;

    return unproject(centerPoint + offset, zoom);
}

Geometry::Point Viewport::boundsOffset(const Geometry::Bounds& pxBounds,
                                       const Geo::LatLngBounds& maxBounds,
                                       double zoom) const
{
    const Geometry::Bounds projected(project(maxBounds.northEast(), zoom), project(maxBounds.southWest(), zoom));
    const Geometry::Point minOffset = projected.min() - pxBounds.min();
    const Geometry::Point maxOffset = projected.max() - pxBounds.max();

    return Geometry::Point(rebound(minOffset.x, -maxOffset.x), rebound(minOffset.y, -maxOffset.y));
}

Geometry::Point Viewport::centerLayerPoint() const
{
    return containerPointToLayerPoint(m_size / 2.0);
}

Geometry::Point Viewport::centerOffset(const Geo::LatLng& latlng) const
{
    return latLngToLayerPoint(latlng) - centerLayerPoint();
}

// ---- Queries ----

double Viewport::boundsZoom(const Geo::LatLngBounds& bounds, bool inside, const Geometry::Point& padding) const
{
    const Geometry::Point size = m_size - padding;
    const Geometry::Point boundsSize =
        Geometry::Bounds(project(bounds.southEast(), m_zoom), project(bounds.northWest(), m_zoom)).size();

    const double scaleX = size.x / boundsSize.x;
    const double scaleY = size.y / boundsSize.y;
    const double scale = inside ? std::max(scaleX, scaleY) : std::min(scaleX, scaleY);

    double zoom = scaleZoom(scale, m_zoom);

    const double snap = m_options.zoomSnap;
    if (snap != 0.0 && std::isfinite(zoom)) {
        // Within 1% of a snap level counts as that level.
        zoom = Geometry::roundHalfUp(zoom / (snap / 100.0)) * (snap / 100.0);
        zoom = inside ? std::ceil(zoom / snap) * snap : std::floor(zoom / snap) * snap;
    }

    return std::max(m_options.minZoom, std::min(m_options.maxZoom, zoom));
}

Viewport::CenterZoom Viewport::boundsCenterZoom(const Geo::LatLngBounds& bounds,
                                                const FitBoundsOptions& options) const
{
    const Geometry::Point paddingTL = options.paddingTopLeft.value_or(options.padding);
    const Geometry::Point paddingBR = options.paddingBottomRight.value_or(options.padding);

    double zoom = boundsZoom(bounds, false, paddingTL + paddingBR);
    if (options.maxZoom)
        zoom = std::min(*options.maxZoom, zoom);

    if (std::isinf(zoom))
        return CenterZoom{bounds.center(), zoom};

    const Geometry::Point paddingOffset = (paddingBR - paddingTL) / 2.0;
    const Geometry::Point sw = project(bounds.southWest(), zoom);
    const Geometry::Point ne = project(bounds.northEast(), zoom);
    return CenterZoom{unproject((sw + ne) / 2.0 + paddingOffset, zoom), zoom};
}

Geo::LatLngBounds Viewport::bounds() const
{
    const Geometry::Bounds px = pixelBounds();
    return Geo::LatLngBounds(unproject(px.bottomLeft()), unproject(px.topRight()));
}

Geometry::Bounds Viewport::pixelBounds() const
{
    const Geometry::Point topLeft = m_pixelOrigin - m_panePos;
    return Geometry::Bounds(topLeft, topLeft + m_size);
}

Geometry::Bounds Viewport::pixelBounds(const Geo::LatLng& center, double zoom) const
{
    const Geometry::Point topLeft = newPixelOrigin(center, zoom) - m_panePos;
    return Geometry::Bounds(topLeft, topLeft + m_size);
}

std::optional<Geometry::Bounds> Viewport::pixelWorldBounds() const
{
    return pixelWorldBounds(m_zoom);
}

std::optional<Geometry::Bounds> Viewport::pixelWorldBounds(double zoom) const
{
    return m_options.crs->projectedBounds(zoom);
}

double Viewport::zoomScale(double toZoom) const
{
    return zoomScale(toZoom, m_zoom);
}

double Viewport::zoomScale(double toZoom, double fromZoom) const
{
    return m_options.crs->scale(toZoom) / m_options.crs->scale(fromZoom);
}

double Viewport::scaleZoom(double scale) const
{
    return scaleZoom(scale, m_zoom);
}

double Viewport::scaleZoom(double scale, double fromZoom) const
{
    const double zoom = m_options.crs->zoom(scale * m_options.crs->scale(fromZoom));
    return std::isnan(zoom) ? std::numeric_limits<double>::infinity() : zoom;
}

// ---- Coordinate conversions ----

Geometry::Point Viewport::project(const Geo::LatLng& latlng) const
{
    return project(latlng, m_zoom);
}

Geometry::Point Viewport::project(const Geo::LatLng& latlng, double zoom) const
{
    return m_options.crs->latLngToPoint(latlng, zoom);
}

Geo::LatLng Viewport::unproject(const Geometry::Point& point) const
{
    return unproject(point, m_zoom);
}

Geo::LatLng Viewport::unproject(const Geometry::Point& point, double zoom) const
{
    return m_options.crs->pointToLatLng(point, zoom);
}

Geo::LatLng Viewport::layerPointToLatLng(const Geometry::Point& point) const
{
    return unproject(point + m_pixelOrigin);
}

Geometry::Point Viewport::latLngToLayerPoint(const Geo::LatLng& latlng) const
{
    return project(latlng).rounded() - m_pixelOrigin;
}

Geometry::Point Viewport::containerPointToLayerPoint(const Geometry::Point& point) const
{
    return point - m_panePos;
}

Geometry::Point Viewport::layerPointToContainerPoint(const Geometry::Point& point) const
{
    return point + m_panePos;
}

Geo::LatLng Viewport::containerPointToLatLng(const Geometry::Point& point) const
{
    return layerPointToLatLng(containerPointToLayerPoint(point));
}

Geometry::Point Viewport::latLngToContainerPoint(const Geo::LatLng& latlng) const
{
    return layerPointToContainerPoint(latLngToLayerPoint(latlng));
}

Geometry::Point Viewport::newPixelOrigin(const Geo::LatLng& center, double zoom, bool round) const
{
    const Geometry::Point origin = project(center, zoom) - m_size / 2.0 + m_panePos;
    return round ? origin.rounded() : origin;
}

double Viewport::distance(const Geo::LatLng& a, const Geo::LatLng& b) const
{
    return m_options.crs->distance(a, b);
}

Geo::LatLng Viewport::wrapLatLng(const Geo::LatLng& latlng) const
{
    return m_options.crs->wrapLatLng(latlng);
}

Geo::LatLngBounds Viewport::wrapLatLngBounds(const Geo::LatLngBounds& bounds) const
{
    return m_options.crs->wrapLatLngBounds(bounds);
}

} // namespace MapView
