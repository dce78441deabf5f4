#include "noeul/graphics/transformable.hpp"

#include <cmath>

#include <glm/gtc/matrix_transform.hpp>
#include <sung/basic/angle.hpp>

#include "noeul/math/mamath.hpp"


// Moveable
namespace noeul {

    void Moveable::set_position(const glm::vec2& pos) {
        pos_ = pos;
        this->on_position_moved();
    }

    void Moveable::move(const glm::vec2& offset) {
        pos_ += offset;
        this->on_position_moved();
    }

    void Moveable::reset_translation() {
        pos_ = glm::vec2{ 0, 0 };
        this->on_position_reset();
    }

}  // namespace noeul


// Transformable
namespace noeul {

    void Transformable::set_rotation(float degrees) {
        if (degrees > 360 || degrees < -360 || std::isnan(degrees))
            rotation_ = 0;
        else
            rotation_ = static_cast<int16_t>(degrees);
    }

    void Transformable::rotate(float degrees) {
        this->set_rotation(rotation_ + degrees);
    }

    void Transformable::scale(const glm::vec2& factor) {
        if (!std::isnan(factor.x))
            scale_.x *= factor.x;
        if (!std::isnan(factor.y))
            scale_.y *= factor.y;
    }

    glm::mat4 Transformable::make_model_mat() const {
        const glm::vec3 center{ center_.x, center_.y, 0 };

        glm::mat4 m{ 1 };
        m = glm::translate(m, glm::vec3{ pos_, 0 });
        if (rotation_ != 0) {
            m = glm::translate(m, center);
            m = glm::rotate(
                m,
                sung::TAngle<float>::from_deg(rotation_).rad(),
                glm::vec3{ 0, 0, 1 }
            );
            m = glm::translate(m, -center);
        }
        m = glm::scale(m, glm::vec3{ scale_, 1 });
        return m;
    }

    glm::vec2 Transformable::transform_point(const glm::vec2& p) const {
        const glm::vec2 center{ center_.x, center_.y };
        const auto scaled = p * scale_;
        const auto angle = sung::TAngle<float>::from_deg(rotation_);
        return rotate_vec(scaled - center, angle) + center + pos_;
    }

}  // namespace noeul
