#include "discsim/arch/native/renderer_native.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

#include "discsim/core/constants.hpp"

Renderer::Renderer(unsigned int screenWidth, unsigned int screenHeight)
    : initialized(false)
    , fontLoaded(false)
    , screenWidth(screenWidth)
    , screenHeight(screenHeight)
{
}

Renderer::~Renderer() = default;

bool Renderer::init() {
    window.create(sf::VideoMode(screenWidth, screenHeight), "Disc Simulator",
                  sf::Style::Titlebar | sf::Style::Close);
    if (!window.isOpen()) {
        std::cerr << "Failed to create " << screenWidth << "x" << screenHeight << " window\n";
        return false;
    }
    window.setFramerateLimit(SimulatorConstants::TargetFPS);

    fontLoaded = font.loadFromFile("assets/fonts/arial.ttf");
    if (!fontLoaded) {
        std::cerr << "Failed to load font assets/fonts/arial.ttf, overlay disabled\n";
    }
    initialized = true;
    return true;
}

void Renderer::clear() {
    window.clear(sf::Color(240, 240, 240));
}

void Renderer::present() {
    window.display();
}

void Renderer::renderBodies(const std::vector<BodySnapshot>& bodies) {
    for (const auto& body : bodies) {
        auto const radius = static_cast<float>(body.radius);
        sf::CircleShape circle(radius);
        circle.setOrigin(radius, radius);
        circle.setPosition(static_cast<float>(body.position.x), static_cast<float>(body.position.y));
        circle.setFillColor(sf::Color(body.color.r, body.color.g, body.color.b, body.color.a));
        window.draw(circle);
    }
}

void Renderer::renderOverlay(float fps, std::size_t bodyCount, const SystemConfig& config,
                             bool paused, const std::string& scenarioName) {
    if (!fontLoaded) {
        return;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1)
        << "FPS: " << fps << "   bodies: " << bodyCount
        << "   scenario: " << scenarioName << (paused ? "   [PAUSED]" : "") << "\n"
        << "gravity: " << config.GravityMagnitude
        << "   friction: " << (config.FrictionEnabled ? "on" : "off")
        << "   elasticity: " << std::setprecision(2) << config.Elasticity
        << "   step: " << (config.Mode == StepMode::FIXED ? "fixed" : "variable");
    renderText(oss.str(), 10, 10);
}

void Renderer::renderText(const std::string& text, int x, int y, sf::Color color) {
    if (!fontLoaded) {
        return;
    }
    sf::Text sfText;
    sfText.setFont(font);
    sfText.setString(text);
    sfText.setCharacterSize(14);
    sfText.setFillColor(color);
    sfText.setPosition(static_cast<float>(x), static_cast<float>(y));
    window.draw(sfText);
}
