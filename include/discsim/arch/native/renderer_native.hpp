/**
 * @file renderer_native.hpp
 * @brief Graphics rendering using SFML
 *
 * This class handles:
 * - Window creation and frame presentation
 * - Drawing every body as a filled circle in its own colour
 * - A small text overlay (FPS and current parameters) when a font is available
 */

#pragma once

#include <string>
#include <vector>
#include <SFML/Graphics.hpp>

#include "discsim/core/body_store.hpp"
#include "discsim/core/system_config.hpp"

/**
 * @class Renderer
 * @brief Draws the body list handed over once per frame
 */
class Renderer {
public:
    Renderer(unsigned int screenWidth, unsigned int screenHeight);
    ~Renderer();

    /**
     * @brief Creates the SFML window and tries to load the overlay font
     * @return true if the window is open; a missing font only disables text
     */
    bool init();

    void clear();
    void present();

    void renderBodies(const std::vector<BodySnapshot>& bodies);

    /**
     * @brief Draws FPS, body count and the live parameters in the top-left corner
     */
    void renderOverlay(float fps, std::size_t bodyCount, const SystemConfig& config,
                       bool paused, const std::string& scenarioName);

    void renderText(const std::string& text, int x, int y, sf::Color color = sf::Color::Black);

    sf::RenderWindow& getWindow() { return window; }
    bool isInitialized() const { return initialized; }

private:
    sf::RenderWindow window;
    sf::Font font;
    bool initialized;
    bool fontLoaded;
    unsigned int screenWidth;
    unsigned int screenHeight;
};
