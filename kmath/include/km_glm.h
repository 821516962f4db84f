#ifndef KM_GLM_H_
#define KM_GLM_H_

/**
 * @file km_glm.h
 * @brief Conversions between kmath types and GLM
 *
 * Both libraries store matrices column-major, so the conversions are plain
 * copies through the raw component arrays.
 */

#include "km_la.h"
#include <glm/glm.hpp>
#include <glm/gtc/type_ptr.hpp>

namespace kmath {

inline glm::dvec4 toGLM(const Dvec4& v) {
    return glm::make_vec4(v.data());
}

inline glm::vec4 toGLM(const Fvec4& v) {
    return glm::make_vec4(v.data());
}

inline glm::dmat4 toGLM(const Dmat4& m) {
    double raw[16];
    m.store(raw);
    return glm::make_mat4(raw);
}

inline glm::mat4 toGLM(const Fmat4& m) {
    float raw[16];
    m.store(raw);
    return glm::make_mat4(raw);
}

inline Dvec4 fromGLM(const glm::dvec4& v) {
    return Dvec4::load(glm::value_ptr(v));
}

inline Fvec4 fromGLM(const glm::vec4& v) {
    return Fvec4::load(glm::value_ptr(v));
}

inline Dmat4 fromGLM(const glm::dmat4& m) {
    return Dmat4::load(glm::value_ptr(m));
}

inline Fmat4 fromGLM(const glm::mat4& m) {
    return Fmat4::load(glm::value_ptr(m));
}

} // namespace kmath

#endif // KM_GLM_H_
