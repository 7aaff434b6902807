#pragma once

/*
    ASH ШЭЙДИНГ САН

    ФАЙЛ: convention.hpp
    МОДУЛЬ: camera
    ЗОРИЛГО: Зүүн гарын дүрэмтэй (LH) харах болон проекцийн матрицууд.
            NDC Z-тэнхлэг [-1, 1], shadow map-ийн depth01 = z * 0.5 + 0.5.
*/


#include <cmath>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

namespace ash
{
    inline glm::mat4 look_at_lh(const glm::vec3& eye, const glm::vec3& target, const glm::vec3& up)
    {
        return glm::lookAtLH(eye, target, up);
    }

    inline glm::mat4 perspective_lh_no(float fovy_radians, float aspect, float znear, float zfar)
    {
        return glm::perspectiveLH_NO(fovy_radians, aspect, znear, zfar);
    }

    inline glm::mat4 ortho_lh_no(float left, float right, float bottom, float top, float znear, float zfar)
    {
        return glm::orthoLH_NO(left, right, bottom, top, znear, zfar);
    }

    // Гэрэл бараг босоо үед up векторыг Z болгож lookAt доройтохоос сэргийлнэ.
    inline glm::vec3 stable_up_for(const glm::vec3& dir)
    {
        return (std::abs(dir.y) > 0.95f) ? glm::vec3(0.0f, 0.0f, 1.0f) : glm::vec3(0.0f, 1.0f, 0.0f);
    }
}
