#include "app.hpp"
#include "util/logger.hpp"
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <unistd.h>

using namespace screen_mirror;

static MirrorApp* g_app = nullptr;
static volatile sig_atomic_t g_interrupted = 0;

// First SIGINT/SIGTERM asks the loop to wind down, the second one exits
static void on_terminate(int /*sig*/) {
    if (g_interrupted) {
        static const char msg[] = "Interrupted again, exiting\n";
        ssize_t ignored = write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)ignored;
        _exit(130);
    }
    g_interrupted = 1;
    if (g_app) {
        g_app->stop();
    }
}

static void print_usage(const char* prog) {
    printf("Mirror a window or screen onto another display, optionally flipped.\n\n");
    printf("Usage: %s [options]\n\n", prog);
    printf("  -d, --display DISPLAY     X11 display (default: $DISPLAY)\n");
    printf("  -c, --capture BACKEND     Capture backend: auto, x11, pipewire (default: auto)\n");
    printf("  -w, --window ID           Source to mirror at startup (decimal or 0x hex)\n");
    printf("  -D, --output ID           Display to mirror onto (default: first non-primary)\n");
    printf("  -H, --flip-h              Flip horizontally (default: on)\n");
    printf("  -V, --flip-v              Flip vertically (default: off)\n");
    printf("  -N, --no-flip             Clear both flips before applying -H/-V\n");
    printf("  -C, --controls            Show flip controls when hovering the mirror\n");
    printf("  -f, --fps FPS             Capture frame-rate cap, 1-%d (default: 60)\n", MAX_CAPTURE_FPS);
    printf("  -s, --scale N             Capture size multiplier, 1-%d (default: 2)\n", MAX_SCALE_FACTOR);
    printf("  -q, --queue-depth N       Frames buffered before dropping the oldest, 1-%d (default: 5)\n",
           MAX_QUEUE_DEPTH);
    printf("  -k, --cursor              Include the cursor in the mirror\n");
    printf("  -l, --list-sources        List capturable sources and exit\n");
    printf("  -L, --list-displays       List displays and exit\n");
    printf("  -v, --verbose             Enable info logging (use -vv for debug)\n");
    printf("  -h, --help                Show this help\n");
    printf("\nBackends built in:");
#ifdef HAVE_X11
    printf(" x11");
#endif
#ifdef HAVE_PIPEWIRE
    printf(" pipewire");
#endif
    printf("  (auto picks pipewire under Wayland, x11 otherwise)\n");
    printf("\nEnvironment:\n");
    printf("  SCREEN_MIRROR_LOG   Log level: debug, info, warn, error (default: warn)\n");
}

static bool parse_id(const char* text, uint32_t& out) {
    char* end = nullptr;
    unsigned long value = strtoul(text, &end, 0);
    if (!end || *end != '\0' || value == 0 || value > 0xffffffffUL) {
        return false;
    }
    out = static_cast<uint32_t>(value);
    return true;
}

static int clamp_arg(const char* text, int min_value, int max_value) {
    int value = atoi(text);
    if (value < min_value) value = min_value;
    if (value > max_value) value = max_value;
    return value;
}

int main(int argc, char* argv[]) {
    MirrorConfig config;
    bool list_sources = false;
    bool list_displays = false;
    bool flips_cleared = false;
    bool flip_h = false;
    bool flip_v = false;

    static struct option long_options[] = {
        {"display", required_argument, 0, 'd'},
        {"capture", required_argument, 0, 'c'},
        {"window", required_argument, 0, 'w'},
        {"output", required_argument, 0, 'D'},
        {"flip-h", no_argument, 0, 'H'},
        {"flip-v", no_argument, 0, 'V'},
        {"no-flip", no_argument, 0, 'N'},
        {"controls", no_argument, 0, 'C'},
        {"fps", required_argument, 0, 'f'},
        {"scale", required_argument, 0, 's'},
        {"queue-depth", required_argument, 0, 'q'},
        {"cursor", no_argument, 0, 'k'},
        {"list-sources", no_argument, 0, 'l'},
        {"list-displays", no_argument, 0, 'L'},
        {"verbose", no_argument, 0, 'v'},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}
    };

    int verbosity = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, "d:c:w:D:HVNCf:s:q:klLvh", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'd':
                config.display = optarg;
                break;
            case 'c':
                if (strcmp(optarg, "auto") == 0) {
                    config.capture_backend = CaptureBackendType::AUTO;
                } else if (strcmp(optarg, "x11") == 0) {
                    config.capture_backend = CaptureBackendType::X11;
                } else if (strcmp(optarg, "pipewire") == 0 || strcmp(optarg, "pw") == 0) {
                    config.capture_backend = CaptureBackendType::PIPEWIRE;
                } else {
                    fprintf(stderr, "Unknown capture backend: %s\n", optarg);
                    print_usage(argv[0]);
                    return 1;
                }
                break;
            case 'w':
                if (!parse_id(optarg, config.source_id)) {
                    fprintf(stderr, "Invalid source id: %s\n", optarg);
                    return 1;
                }
                break;
            case 'D':
                if (!parse_id(optarg, config.target_display)) {
                    fprintf(stderr, "Invalid display id: %s\n", optarg);
                    return 1;
                }
                break;
            case 'H':
                flip_h = true;
                break;
            case 'V':
                flip_v = true;
                break;
            case 'N':
                flips_cleared = true;
                break;
            case 'C':
                config.show_controls = true;
                break;
            case 'f':
                config.capture_fps = clamp_arg(optarg, 1, MAX_CAPTURE_FPS);
                break;
            case 's':
                config.scale_factor = clamp_arg(optarg, 1, MAX_SCALE_FACTOR);
                break;
            case 'q':
                config.queue_depth = clamp_arg(optarg, 1, MAX_QUEUE_DEPTH);
                break;
            case 'k':
                config.show_cursor = true;
                break;
            case 'l':
                list_sources = true;
                break;
            case 'L':
                list_displays = true;
                break;
            case 'v':
                verbosity++;
                break;
            case 'h':
                print_usage(argv[0]);
                return 0;
            default:
                print_usage(argv[0]);
                return 1;
        }
    }

    if (flips_cleared) {
        config.flip_horizontal = false;
        config.flip_vertical = false;
    }
    if (flip_h) config.flip_horizontal = true;
    if (flip_v) config.flip_vertical = true;

    // SCREEN_MIRROR_LOG sets the base level, -v/-vv raise it
    const char* env_level = std::getenv("SCREEN_MIRROR_LOG");
    if (env_level) {
        LogLevel level;
        if (Logger::parse_level(env_level, level)) {
            Logger::set_level(level);
        } else {
            fprintf(stderr, "Ignoring unknown SCREEN_MIRROR_LOG level: %s\n", env_level);
        }
    }
    if (verbosity >= 2) {
        Logger::set_level(LogLevel::DEBUG);
    } else if (verbosity == 1 && Logger::get_level() > LogLevel::INFO) {
        Logger::set_level(LogLevel::INFO);
    }

    signal(SIGINT, on_terminate);
    signal(SIGTERM, on_terminate);

    MirrorApp app;
    g_app = &app;

    if (!app.init(config)) {
        LOG_ERROR("Failed to initialize");
        g_app = nullptr;
        return 1;
    }

    int result;
    if (list_displays || list_sources) {
        result = 0;
        if (list_displays) result = app.list_displays();
        if (list_sources && result == 0) result = app.list_sources();
    } else {
        printf("Screen Mirror | %d FPS | %dx scale | queue %d | flip h=%s v=%s\n",
               config.capture_fps, config.scale_factor, config.queue_depth,
               config.flip_horizontal ? "on" : "off", config.flip_vertical ? "on" : "off");
        fflush(stdout);
        result = app.run();
    }

    g_app = nullptr;
    LOG_INFO("Exited");
    return result;
}
