#include "mirror_coordinator.hpp"
#include "util/logger.hpp"

namespace screen_mirror {

bool captures_own_output(const CaptureSource& source, const SurfacePlacement& placement) {
    return source.kind == SourceKind::DISPLAY && placement.pinned &&
           source.bounds.intersects(placement.bounds);
}

MirrorCoordinator::MirrorCoordinator(StreamSession& session, DisplayDirectory& displays,
                                     SurfaceFactory factory)
    : m_session(session)
    , m_displays(displays)
    , m_factory(std::move(factory)) {
}

MirrorCoordinator::~MirrorCoordinator() {
    m_on_closed = nullptr;
    close();
}

SurfacePlacement MirrorCoordinator::resolve_placement(uint32_t display_id) {
    SurfacePlacement placement;
    std::vector<DisplayDescriptor> displays = m_displays.list_displays();

    const DisplayDescriptor* display = find_display(displays, display_id);
    if (!display) {
        for (const DisplayDescriptor& candidate : displays) {
            if (candidate.is_primary) {
                display = &candidate;
                break;
            }
        }
        if (display && display_id != NO_DISPLAY) {
            LOG_WARN("Display %u not found, using primary display %s", display_id, display->name.c_str());
        }
    }

    if (display) {
        placement.pinned = true;
        placement.bounds = display->bounds;
    }
    return placement;
}

bool MirrorCoordinator::open(const MirrorWindowState& state) {
    // Replacing the surface keeps the session running
    if (m_surface) {
        m_session.relay().unsubscribe(m_relay_subscription);
        m_relay_subscription = 0;
        m_surface->close();
        m_surface.reset();
    }

    std::unique_ptr<MirrorSurface> surface = m_factory ? m_factory() : nullptr;
    if (!surface) {
        LOG_ERROR("No mirror surface available");
        return false;
    }

    SurfacePlacement placement = resolve_placement(state.display_id);
    const CaptureSource& source = m_session.get_source();
    if (m_session.get_state() != SessionState::IDLE && captures_own_output(source, placement)) {
        LOG_WARN("Source '%s' covers the target display, the mirror will show itself",
                 source.title.c_str());
    }
    if (!surface->open(placement, state.controls_visible)) {
        LOG_ERROR("Failed to open mirror surface");
        return false;
    }

    surface->set_flip_toggle_callback([this](FlipAxis axis) { toggle_flip(axis); });
    surface->set_close_request_callback([this]() { close(); });

    m_surface = std::move(surface);
    m_state = state;
    m_relay_subscription = m_session.relay().subscribe([this](const MirroredFrame*) {
        present_latest();
    });
    present_latest();

    LOG_INFO("Mirror opened (%s, flip h=%d v=%d)",
             placement.pinned ? "pinned" : "centered", m_state.flip.horizontal, m_state.flip.vertical);
    return true;
}

void MirrorCoordinator::close() {
    bool was_open = m_surface != nullptr;
    if (m_surface) {
        m_session.relay().unsubscribe(m_relay_subscription);
        m_relay_subscription = 0;
        m_surface->close();
        m_surface.reset();
    }

    // Presentation and capture end together
    m_session.stop();

    if (was_open) {
        LOG_INFO("Mirror closed");
        if (m_on_closed) {
            m_on_closed();
        }
    }
}

void MirrorCoordinator::set_flip(FlipState flip) {
    if (flip == m_state.flip) {
        return;
    }
    m_state.flip = flip;
    present_latest();
}

void MirrorCoordinator::toggle_flip(FlipAxis axis) {
    FlipState flip = m_state.flip;
    flip.toggle(axis);
    LOG_INFO("Flip %s %s", flip_axis_name(axis), flip.get(axis) ? "on" : "off");
    set_flip(flip);
}

void MirrorCoordinator::present_latest() {
    if (!m_surface) {
        return;
    }
    PresentedFrame presented;
    presented.flip = m_state.flip;
    if (const MirroredFrame* latest = m_session.relay().get_latest()) {
        presented.image = latest->image;
        presented.sequence = latest->sequence;
    }
    m_surface->present(presented);
}

}  // namespace screen_mirror
