#include <tabletspace/TabletSpace.hpp>

#include <X11/Xlib.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

using namespace TS;
using namespace std::chrono_literals;

static std::atomic<bool> g_running{true};

static void sigint_handler(int) {
    g_running.store(false, std::memory_order_release);
}

static auto print_devices(Manager const& manager) -> void {
    for (auto const& tablet : manager.tablets())
        std::cout << "  " << tablet << "\n";
    for (auto const& tool : manager.tools())
        std::cout << "  " << tool << "\n";
    for (auto const& pad : manager.pads())
        std::cout << "  " << pad << "\n";
}

// Opens a window on the X server and prints every tablet event delivered to it.
auto main() -> int {
    Display* display = XOpenDisplay(nullptr);
    if (!display) {
        std::cerr << "cannot open X display\n";
        return 1;
    }
    int const screen = DefaultScreen(display);
    Window    window = XCreateSimpleWindow(display, RootWindow(display, screen), 0, 0, 800, 600, 0,
                                           BlackPixel(display, screen), WhitePixel(display, screen));
    XStoreName(display, window, "tablet_events_example");
    XMapWindow(display, window);
    XFlush(display);

    int exitCode = 0;
    {
        auto manager = Builder{}.buildRaw(XlibWindowHandle{display, window});
        if (!manager) {
            std::cerr << "no tablet backend: " << describeError(manager.error()) << "\n";
            exitCode = 1;
        } else {
            std::signal(SIGINT, sigint_handler);
            std::cout << "devices:\n";
            print_devices(*manager);

            while (g_running.load(std::memory_order_acquire)) {
                if (auto pumped = manager->pump(); !pumped) {
                    std::cerr << "pump failed: " << describeError(pumped.error()) << "\n";
                    exitCode = 1;
                    break;
                }
                for (auto const& event : manager->events())
                    std::cout << event << "\n";
                std::this_thread::sleep_for(8ms);
            }
        }
        // The Manager goes before the display it was built from.
    }

    XDestroyWindow(display, window);
    XCloseDisplay(display);
    return exitCode;
}
