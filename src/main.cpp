#include <SDL2/SDL.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <optional>
#include <string>
#include <stdexcept>
#include "averager.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "curve_fitter.hpp"
#include "density_clusterer.hpp"
#include "errors.hpp"
#include "geometry.hpp"
#include "line_source.hpp"
#include "renderer.hpp"
#include "serial_line_source.hpp"
#include "session.hpp"

enum class Command { Clear, ToggleInterpolate, RemoveOutliers, Save, Import, Quit };

static std::atomic<bool> interrupted{false};

static void on_sigint(int){ interrupted = true; }

static std::optional<Command> key_to_command(SDL_Keycode k){
    switch (k){
        case SDLK_c: return Command::Clear;
        case SDLK_i: return Command::ToggleInterpolate;
        case SDLK_o: return Command::RemoveOutliers;
        case SDLK_s: return Command::Save;
        case SDLK_b: return Command::Import;
        case SDLK_ESCAPE: return Command::Quit;
        default: return std::nullopt;
    }
}

static std::string prompt_file_name(const char* what){
    printf("Enter %s file name: ", what);
    fflush(stdout);
    std::string name;
    if (!std::getline(std::cin, name)) return "";
    return name.empty() ? "" : name + ".csv";
}

// returns false when the operator asked to quit
static bool run_command(Command cmd, SessionController& session, LineSource& source){
    try {
        switch (cmd){
            case Command::Clear:
                session.clear();
                printf("clear\n");
                break;
            case Command::ToggleInterpolate:
                session.toggle_interpolate();
                printf("Interpolate = %s\n", session.mode()==SessionMode::Interpolating ? "True" : "False");
                break;
            case Command::RemoveOutliers: {
                size_t dropped = session.remove_outliers();
                printf("removed %zu outliers, %zu points left\n", dropped, session.state().finalized.size());
                break;
            }
            case Command::Save: {
                std::string name = prompt_file_name("save");
                // readings queued while the prompt blocked are stale
                source.discard_pending();
                if (name.empty()) { fprintf(stderr, "save cancelled\n"); break; }
                session.save(name);
                printf("saved %zu points to %s\n", session.state().finalized.size(), name.c_str());
                break;
            }
            case Command::Import: {
                std::string name = prompt_file_name("import");
                source.discard_pending();
                if (name.empty()) { fprintf(stderr, "import cancelled\n"); break; }
                size_t n = session.import(name);
                printf("imported %zu points from %s\n", n, name.c_str());
                break;
            }
            case Command::Quit:
                return false;
        }
    } catch (const FileError& ex) {
        fprintf(stderr, "File error: %s\n", ex.what());
    }
    return true;
}

static void warn_about_sensor_reach(const Parameters& p, const Geometry& g){
    if (g.baseline_length < p.minimum_distance || g.baseline_breadth < p.minimum_distance)
        fprintf(stderr, "[warn] workspace edge is closer than the sensor minimum distance (%d mm)\n", p.minimum_distance);
    if (g.max_length > p.maximum_distance || g.max_breadth > p.maximum_distance)
        fprintf(stderr, "[warn] far workspace corner is beyond the sensor maximum distance (%d mm)\n", p.maximum_distance);
}

int main(int argc, char** argv){
    const char* cfgPath = argc>1? argv[1] : "parameters.json";
    try {
        Parameters params = load_parameters(cfgPath);
        Geometry geometry = make_geometry(params);
        check_geometry(geometry);
        warn_about_sensor_reach(params, geometry);
        printf("dL in [%.1f, %.1f], dB in [%.1f, %.1f]\n",
               geometry.baseline_length, geometry.max_length, geometry.baseline_breadth, geometry.max_breadth);

        SerialLineSource serial(params.port, params.baud);
        SteadyClock clock;
        Averager averager(serial, clock, geometry, params.average_of, std::chrono::milliseconds(params.timeout_ms));

        BSplineFitter fitter(2);
        Dbscan dbscan;
        SessionController session(params, fitter, dbscan);

        std::signal(SIGINT, on_sigint);
        {
            SdlRenderer renderer(params);
            bool quit=false;
            while(!quit && !interrupted){
                SDL_Event e; while(SDL_PollEvent(&e)){
                    if (e.type==SDL_QUIT) quit=true;
                    if (e.type==SDL_KEYDOWN && e.key.repeat==0){
                        auto cmd = key_to_command(e.key.keysym.sym);
                        if (cmd && !run_command(*cmd, session, serial)) quit=true;
                    }
                }
                if (quit) break;

                try {
                    Coordinate c = averager.acquire(&interrupted);
                    printf("%d %d\n", c.x, c.y);
                    session.add_coordinate(c);
                } catch (const AcquisitionStall& ex) {
                    fprintf(stderr, "Acquisition stalled: %s\n", ex.what());
                } catch (const AcquisitionCancelled&) {
                    break;
                }

                renderer.draw(session.state());
                SDL_Delay((Uint32)params.delay_ms);
                SDL_Delay(1);
            }
            const auto& st = averager.stats();
            printf("readings: %llu accepted, %llu malformed, %llu out of range\n",
                   (unsigned long long)st.accepted, (unsigned long long)st.format_rejects,
                   (unsigned long long)st.range_rejects);
        }
        SDL_Quit();
    } catch (const DegenerateGeometryError& ex) {
        fprintf(stderr, "Configuration error: %s\n", ex.what());
        SDL_Quit();
        return 2;
    } catch (const std::exception& ex) {
        fprintf(stderr, "%s\n", ex.what());
        SDL_Quit();
        return 1;
    }
    return 0;
}
