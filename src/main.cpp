#include <SDL.h>

#include <string>

#include <imgui.h>
#include <imgui_impl_sdl2.h>
#include <imgui_impl_sdlrenderer2.h>

#include "gradostroi/util/log.h"

#include "gradostroi/core/content.h"
#include "gradostroi/core/content_validation.h"
#include "gradostroi/core/simulation.h"
#include "ui/app.h"

namespace {

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

} // namespace

int main(int argc, char** argv) {
  try {
    gradostroi::log::set_level(gradostroi::log::Level::Info);

    const std::string content_path = get_str_arg(argc, argv, "--content", "");
    auto content = content_path.empty() ? gradostroi::default_content_db()
                                        : gradostroi::load_content_db_from_file(content_path);
    const auto errors = gradostroi::validate_content_db(content);
    if (!errors.empty()) {
      for (const auto& e : errors) gradostroi::log::error("Content: " + e);
      return 1;
    }

    gradostroi::AutosaveConfig autosave;
    autosave.dir = get_str_arg(argc, argv, "--autosave-dir", autosave.dir);

    gradostroi::SimConfig cfg;
    cfg.autosave_interval_days = autosave.interval_days;

    gradostroi::Simulation sim(std::move(content), cfg);
    gradostroi::ui::App app(std::move(sim), autosave);

    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
      gradostroi::log::error(std::string("SDL_Init failed: ") + SDL_GetError());
      return 1;
    }

    SDL_Window* window = SDL_CreateWindow("Gradostroi", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, 1280, 720,
                                          SDL_WINDOW_RESIZABLE);
    if (!window) {
      gradostroi::log::error(std::string("SDL_CreateWindow failed: ") + SDL_GetError());
      return 1;
    }

    SDL_Renderer* renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!renderer) {
      gradostroi::log::error(std::string("SDL_CreateRenderer failed: ") + SDL_GetError());
      return 1;
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsDark();

    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;

    ImGui_ImplSDL2_InitForSDLRenderer(window, renderer);
    ImGui_ImplSDLRenderer2_Init(renderer);

    bool running = true;
    while (running) {
      SDL_Event e;
      while (SDL_PollEvent(&e)) {
        ImGui_ImplSDL2_ProcessEvent(&e);
        if (e.type == SDL_QUIT) running = false;
        if (e.type == SDL_WINDOWEVENT && e.window.event == SDL_WINDOWEVENT_CLOSE &&
            e.window.windowID == SDL_GetWindowID(window))
          running = false;
        app.on_event(e);
      }

      ImGui_ImplSDLRenderer2_NewFrame();
      ImGui_ImplSDL2_NewFrame();
      ImGui::NewFrame();

      app.frame();

      ImGui::Render();
      SDL_SetRenderDrawColor(renderer, 20, 24, 20, 255);
      SDL_RenderClear(renderer);
      ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), renderer);
      SDL_RenderPresent(renderer);
    }

    ImGui_ImplSDLRenderer2_Shutdown();
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();

    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 0;
  } catch (const std::exception& e) {
    gradostroi::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
