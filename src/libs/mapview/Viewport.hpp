// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "mapview/MapViewGlobal.hpp"
#include "mapview/MapViewTypes.hpp"
#include "mapview/FlyToPath.hpp"
#include "mapview/FrameScheduling.hpp"
#include "mapview/PosAnimation.hpp"
#include "mapview/ViewportOptions.hpp"
#include "mapview/api/IFrameClock.hpp"
#include "geo/Crs.hpp"
#include "geo/LatLng.hpp"
#include "geo/LatLngBounds.hpp"
#include "geometry/Bounds.hpp"
#include "geometry/Point.hpp"
#include "utils/Result.hpp"

#include <QtCore/QObject>

#include <optional>

namespace MapView {

// The map view: geographic center, fractional zoom, container size and the
// pane offset applied while panning. Every change is published through
// signals after all fields have been updated.
//
// Only one animation runs at a time. Starting a new view change stops the
// running one first: a pan jumps to its rounded position, a zoom animation is
// committed to its target and a fly-to is abandoned where it is.
class MAPVIEW_EXPORT Viewport final : public QObject
{
    Q_OBJECT

public:
    struct CenterZoom {
        Geo::LatLng center;
        double zoom = 0.0;
    };

    Viewport(Api::IFrameClock* clock,
             const Geometry::Point& size,
             const Geo::LatLng& center,
             double zoom,
             ViewportOptions options = {},
             QObject* parent = nullptr);
    ~Viewport() override;

    // ---- State ----
    const ViewportOptions& options() const { return m_options; }
    const Geo::Crs& crs() const { return *m_options.crs; }
    Api::IFrameClock* clock() const { return m_clock; }

    double zoom() const { return m_zoom; }
    Geo::LatLng center() const;
    const Geometry::Point& size() const { return m_size; }
    const Geometry::Point& pixelOrigin() const { return m_pixelOrigin; }
    const Geometry::Point& panePos() const { return m_panePos; }
    double minZoom() const { return m_options.minZoom; }
    double maxZoom() const { return m_options.maxZoom; }

    bool isAnimatingZoom() const { return m_zoomAnim.has_value(); }
    double animationTargetZoom() const;
    Geo::LatLng animationTargetCenter() const;
    bool isPanning() const { return m_panAnim.isRunning(); }
    bool isFlying() const { return m_fly.has_value(); }

    // ---- View changes ----
    void setView(const Geo::LatLng& center, double zoom, ZoomPanOptions options = {});
    void setZoom(double zoom, const ZoomOptions& options = {});
    void zoomIn(std::optional<double> delta = std::nullopt, const ZoomOptions& options = {});
    void zoomOut(std::optional<double> delta = std::nullopt, const ZoomOptions& options = {});

    // Keeps |containerPoint| (or the container point of |anchor|) fixed.
    void setZoomAround(const Geometry::Point& containerPoint, double zoom, const ZoomOptions& options = {});
    void setZoomAround(const Geo::LatLng& anchor, double zoom, const ZoomOptions& options = {});

    Utils::Result fitBounds(const Geo::LatLngBounds& bounds, const FitBoundsOptions& options = {});
    Utils::Result fitWorld(const FitBoundsOptions& options = {});

    void panTo(const Geo::LatLng& center, const PanOptions& options = {});
    void panBy(const Geometry::Point& offset, const PanOptions& options = {});
    void panInside(const Geo::LatLng& latlng, const FitBoundsOptions& options = {});
    void panInsideBounds(const Geo::LatLngBounds& bounds, const PanOptions& options = {});

    void flyTo(const Geo::LatLng& center,
               std::optional<double> zoom = std::nullopt,
               const FlyToOptions& options = {});
    Utils::Result flyToBounds(const Geo::LatLngBounds& bounds, const FitBoundsOptions& options = {});

    // Invalid bounds lift the restriction.
    void setMaxBounds(const Geo::LatLngBounds& bounds);
    void setMinZoom(double zoom);
    void setMaxZoom(double zoom);

    void invalidateSize(const Geometry::Point& newSize, const InvalidateSizeOptions& options = {});

    // Finishes any running animation and snaps a fractional zoom.
    void stop();

    // ---- Queries ----
    double boundsZoom(const Geo::LatLngBounds& bounds,
                      bool inside = false,
                      const Geometry::Point& padding = {}) const;
    CenterZoom boundsCenterZoom(const Geo::LatLngBounds& bounds, const FitBoundsOptions& options = {}) const;

    Geo::LatLngBounds bounds() const;
    Geometry::Bounds pixelBounds() const;
    Geometry::Bounds pixelBounds(const Geo::LatLng& center, double zoom) const;
    std::optional<Geometry::Bounds> pixelWorldBounds() const;
    std::optional<Geometry::Bounds> pixelWorldBounds(double zoom) const;

    double zoomScale(double toZoom) const;
    double zoomScale(double toZoom, double fromZoom) const;
    double scaleZoom(double scale) const;
    double scaleZoom(double scale, double fromZoom) const;

    // ---- Coordinate conversions ----
    Geometry::Point project(const Geo::LatLng& latlng) const;
    Geometry::Point project(const Geo::LatLng& latlng, double zoom) const;
    Geo::LatLng unproject(const Geometry::Point& point) const;
    Geo::LatLng unproject(const Geometry::Point& point, double zoom) const;

    Geo::LatLng layerPointToLatLng(const Geometry::Point& point) const;
    Geometry::Point latLngToLayerPoint(const Geo::LatLng& latlng) const;
    Geometry::Point containerPointToLayerPoint(const Geometry::Point& point) const;
    Geometry::Point layerPointToContainerPoint(const Geometry::Point& point) const;
    Geo::LatLng containerPointToLatLng(const Geometry::Point& point) const;
    Geometry::Point latLngToContainerPoint(const Geo::LatLng& latlng) const;

    // Pixel origin the view would have at |center| and |zoom| with the
    // current pane offset.
    Geometry::Point newPixelOrigin(const Geo::LatLng& center, double zoom, bool round = true) const;

    double distance(const Geo::LatLng& a, const Geo::LatLng& b) const;
    Geo::LatLng wrapLatLng(const Geo::LatLng& latlng) const;
    Geo::LatLngBounds wrapLatLngBounds(const Geo::LatLngBounds& bounds) const;

signals:
    void viewPreReset();
    void viewReset();
    void moveStarted();
    void zoomStarted();
    void zoomed(const MoveEvent& event);
    void moved(const MoveEvent& event);
    void moveEnded();
    void zoomEnded();
    void zoomAnimated(const ZoomAnimEvent& event);
    void zoomAnimationStepped(const ZoomAnimEvent& event);
    void resized(const Geometry::Point& oldSize, const Geometry::Point& newSize);
    void zoomLimitsChanged();

private:
    struct ZoomAnimation {
        Geo::LatLng targetCenter;
        double targetZoom = 0.0;
        double startZoom = 0.0;
        double scale = 1.0;
        Geometry::Point startPixelOrigin;
        // Container point that stays fixed while the scale changes.
        Geometry::Point pivot;
        qint64 startTime = 0;
        bool zoomChanged = false;
    };

    struct FlyAnimation {
        FlyToPath path;
        Geometry::Point from;
        Geometry::Point to;
        double startZoom = 0.0;
        Geo::LatLng targetCenter;
        double targetZoom = 0.0;
        qint64 startTime = 0;
        double durationMs = 0.0;
    };

    void stopAnimations();

    bool tryAnimatedPan(const Geo::LatLng& center, const PanOptions& options);
    bool tryAnimatedZoom(const Geo::LatLng& center, double zoom, const ZoomOptions& options);
    void startZoomAnimation(const Geo::LatLng& center, double zoom, const Geometry::Point& offset);
    void stepZoomAnimation();
    void finishZoomAnimation();
    void stepFlyTo();

    void resetView(const Geo::LatLng& center, double zoom);
    void move(const Geo::LatLng& center, double zoom, const MoveEvent& event = {}, bool suppressEvents = false);
    void moveStart(bool zoomChanged, bool noMoveStart);
    void moveEnd(bool zoomChanged);
    void rawPanBy(const Geometry::Point& offset);

    void panInsideMaxBounds();
    void checkTransformLimit();

    double limitZoom(double zoom) const;
    Geo::LatLng limitCenter(const Geo::LatLng& center, double zoom, const Geo::LatLngBounds& bounds) const;
    Geometry::Point boundsOffset(const Geometry::Bounds& pxBounds,
                                 const Geo::LatLngBounds& maxBounds,
                                 double zoom) const;
    Geometry::Point centerLayerPoint() const;
    Geometry::Point centerOffset(const Geo::LatLng& latlng) const;
    bool paneMoved() const { return !m_panePos.isNull(); }

    Api::IFrameClock* m_clock = nullptr;
    ViewportOptions m_options;

    Geometry::Point m_size;
    double m_zoom = 0.0;
    std::optional<Geo::LatLng> m_lastCenter;
    Geometry::Point m_pixelOrigin;
    Geometry::Point m_panePos;

    PosAnimation m_panAnim;
    std::optional<ZoomAnimation> m_zoomAnim;
    Api::FrameToken m_zoomFrame = 0;
    std::optional<FlyAnimation> m_fly;
    Api::FrameToken m_flyFrame = 0;
    FrameTimer m_resizeMoveEndTimer;

    bool m_enforcingBounds = false;
    QMetaObject::Connection m_maxBoundsConnection;
};

} // namespace MapView
