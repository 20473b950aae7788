#ifndef TINYTHIS_SESSION_VIEW_HPP
#define TINYTHIS_SESSION_VIEW_HPP

#include "../../../libtinythis/include/session_controller.hpp"
#include <string>

/**
 * @brief Renders the session into a full-screen frame.
 *
 * Pure function of the state, so the loop can redraw after any change.
 * Lines are separated by '\n'; the terminal layer handles raw-mode CRs.
 */
std::string render_session(const tinythis::SessionState& state,
                           unsigned columns,
                           unsigned rows,
                           bool use_colors);

#endif // TINYTHIS_SESSION_VIEW_HPP
