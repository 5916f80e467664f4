#include "renderer.hpp"
#include "config.hpp"
#include <SDL2/SDL.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

int Viewport::to_px(double x) const {
    return (int)std::lround((x - x_min) / (x_max - x_min) * (width - 1));
}

int Viewport::to_py(double y) const {
    return (int)std::lround((y_max - y) / (y_max - y_min) * (height - 1));
}

Viewport make_viewport(const Parameters& p){
    Viewport v;
    v.x_min = -VIEW_MARGIN;
    v.x_max = p.length + VIEW_MARGIN;
    v.y_min = -VIEW_MARGIN;
    v.y_max = p.breadth + VIEW_MARGIN;
    v.width = std::max(1, (int)std::lround((v.x_max - v.x_min) * p.scale_length));
    v.height = std::max(1, (int)std::lround((v.y_max - v.y_min) * p.scale_breadth));
    return v;
}

static void draw_points(SDL_Renderer* r, const Viewport& v, const PointList& pts, int r255, int g255, int b255){
    SDL_SetRenderDrawColor(r, r255,g255,b255,255);
    for (const auto& p : pts){
        SDL_Rect dot{v.to_px(p.x) - 2, v.to_py(p.y) - 2, 5, 5};
        SDL_RenderFillRect(r, &dot);
    }
}

static void draw_polyline(SDL_Renderer* r, const Viewport& v, const PointList& pts, int r255, int g255, int b255){
    SDL_SetRenderDrawColor(r, r255,g255,b255,255);
    for (size_t i=1;i<pts.size();++i){
        SDL_RenderDrawLine(r, v.to_px(pts[i-1].x), v.to_py(pts[i-1].y),
                              v.to_px(pts[i].x), v.to_py(pts[i].y));
    }
}

SdlRenderer::SdlRenderer(const Parameters& p): params_(p), view_(make_viewport(p)) {
    if (SDL_InitSubSystem(SDL_INIT_VIDEO|SDL_INIT_EVENTS)!=0)
        throw std::runtime_error(std::string("SDL_Init failed: ") + SDL_GetError());
    win_ = SDL_CreateWindow("echoplot", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, view_.width, view_.height, 0);
    if (!win_){
        std::string err = SDL_GetError();
        SDL_QuitSubSystem(SDL_INIT_VIDEO|SDL_INIT_EVENTS);
        throw std::runtime_error("SDL_CreateWindow failed: " + err);
    }
    ren_ = SDL_CreateRenderer(win_, -1, SDL_RENDERER_ACCELERATED);
    if (!ren_) ren_ = SDL_CreateRenderer(win_, -1, SDL_RENDERER_SOFTWARE);
    if (!ren_){
        std::string err = SDL_GetError();
        SDL_DestroyWindow(win_);
        SDL_QuitSubSystem(SDL_INIT_VIDEO|SDL_INIT_EVENTS);
        throw std::runtime_error("SDL_CreateRenderer failed: " + err);
    }
    reset_view();
}

SdlRenderer::~SdlRenderer(){
    SDL_DestroyRenderer(ren_);
    SDL_DestroyWindow(win_);
    SDL_QuitSubSystem(SDL_INIT_VIDEO|SDL_INIT_EVENTS);
}

void SdlRenderer::reset_view(){
    view_ = make_viewport(params_);
    int W = view_.width, H = view_.height;
    SDL_GetRendererOutputSize(ren_, &W, &H);
    view_.width = W;
    view_.height = H;
}

void SdlRenderer::draw(const SessionState& s){
    if (s.generation != generation_){
        reset_view();
        generation_ = s.generation;
    }

    SDL_SetRenderDrawColor(ren_,255,255,255,255); SDL_RenderClear(ren_);

    // workspace outline
    SDL_SetRenderDrawColor(ren_,200,200,200,255);
    SDL_Rect ws{view_.to_px(0), view_.to_py(params_.breadth),
                view_.to_px(params_.length) - view_.to_px(0) + 1,
                view_.to_py(0) - view_.to_py(params_.breadth) + 1};
    SDL_RenderDrawRect(ren_, &ws);

    draw_points(ren_, view_, s.finalized, 0,0,255);
    draw_points(ren_, view_, s.pending, 0,0,255);
    draw_polyline(ren_, view_, s.interpolated, 210,34,34);
    SDL_RenderPresent(ren_);
}
