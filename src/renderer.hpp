#pragma once
#include <cstdint>
#include "points.hpp"

struct Parameters;
struct SDL_Window;
struct SDL_Renderer;

// workspace margin drawn around the plotting bounds, in mm
constexpr int VIEW_MARGIN = 10;

// maps workspace mm (y up) to window pixels (y down)
struct Viewport {
    double x_min = 0, x_max = 1, y_min = 0, y_max = 1;
    int width = 1, height = 1;

    int to_px(double x) const;
    int to_py(double y) const;
};

Viewport make_viewport(const Parameters& p);

class SdlRenderer {
public:
    explicit SdlRenderer(const Parameters& p);
    ~SdlRenderer();
    SdlRenderer(const SdlRenderer&) = delete;
    SdlRenderer& operator=(const SdlRenderer&) = delete;

    void draw(const SessionState& s);

private:
    void reset_view();

    const Parameters& params_;
    SDL_Window* win_ = nullptr;
    SDL_Renderer* ren_ = nullptr;
    Viewport view_;
    uint64_t generation_ = 0;
};
