/**
 * @file exceptions.hpp
 * @brief Defines the exception types raised by the homogenization pipeline
 */

#ifndef HOMCELL_MODELS_EXCEPTIONS_HPP
#define HOMCELL_MODELS_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

/**
 * @class homcell_error
 * @brief Common base of every fatal pipeline error
 *
 * Each error carries the pipeline stage it was raised in so that the
 * driver can report where a run stopped.
 */
class homcell_error : public std::runtime_error {
    public:
        homcell_error(const std::string& stage, const std::string& message)
            : std::runtime_error(message), stage_(stage) {}

        const std::string& stage() const { return stage_; }

    private:
        std::string stage_;
};

/**
 * @brief Malformed or inconsistent mesh / subdomain data, unreadable mesh
 * files, or a mesh whose boundary vertices cannot be paired periodically.
 */
class MeshLoadError : public homcell_error {
    public:
        explicit MeshLoadError(const std::string& message)
            : homcell_error("mesh", message) {}
};

/**
 * @brief Degenerate geometry met while assembling or integrating.
 */
class AssemblyError : public homcell_error {
    public:
        explicit AssemblyError(const std::string& message)
            : homcell_error("assembly", message) {}
};

/**
 * @brief The corrector system could not be factorized or did not converge.
 */
class SingularSystemError : public homcell_error {
    public:
        explicit SingularSystemError(const std::string& message)
            : homcell_error("solve", message) {}
};

/**
 * @brief Invalid permittivity or run configuration.
 */
class ConfigurationError : public homcell_error {
    public:
        explicit ConfigurationError(const std::string& message)
            : homcell_error("configuration", message) {}
};

#endif // HOMCELL_MODELS_EXCEPTIONS_HPP
