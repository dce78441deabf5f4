#pragma once

#include <cstdint>

#include <glm/gtc/type_precision.hpp>
#include <glm/mat4x4.hpp>
#include <glm/vec2.hpp>


namespace noeul {

    class Moveable {

    public:
        virtual ~Moveable() = default;

        void set_position(const glm::vec2& pos);
        void set_position(float x, float y) { this->set_position({ x, y }); }
        const glm::vec2& position() const { return pos_; }

        void move(const glm::vec2& offset);
        void move(float x, float y) { this->move({ x, y }); }

        void reset_translation();

    protected:
        virtual void on_position_moved() {}
        virtual void on_position_reset() {}

        glm::vec2 pos_{ 0, 0 };
    };


    class Transformable : public Moveable {

    public:
        // Angles outside of [-360, 360] reset the rotation to 0
        void set_rotation(float degrees);
        void rotate(float degrees);
        int16_t rotation() const { return rotation_; }

        void set_center(const glm::i16vec2& center) { center_ = center; }
        const glm::i16vec2& center() const { return center_; }

        void set_scale(const glm::vec2& scale) { scale_ = scale; }
        void set_scale(float s) { scale_ = glm::vec2{ s, s }; }
        // NaN components are left unchanged
        void scale(const glm::vec2& factor);
        void scale(float factor) { this->scale(glm::vec2{ factor, factor }); }
        const glm::vec2& get_scale() const { return scale_; }

        // Translate, then rotate about the centre, then scale
        glm::mat4 make_model_mat() const;
        glm::vec2 transform_point(const glm::vec2& p) const;

    protected:
        glm::vec2 scale_{ 1, 1 };
        glm::i16vec2 center_{ 0, 0 };
        int16_t rotation_ = 0;
    };

}  // namespace noeul
