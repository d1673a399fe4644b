/*********************************************************************************************************************************************/
/*  ReceiptWire: template-free extraction of commerce data (vendors, amounts, dates, orders, shipping, line items) from email bodies.        */
/*  Rule cascades, HTML table inference and free-text item segmentation in modern C++20. Deterministic and explainable by construction.      */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef RECEIPTWIRE_ERROR_TAGS_H
#define RECEIPTWIRE_ERROR_TAGS_H

/**
 * @brief Tags classifying errors. Add one to the context of make_error and test for it with contains_type.
 */
namespace receiptwire::errors
{

/// @brief An external service answered with something that cannot be read as an extraction result.
struct uninterpretable_response { static constexpr const char* string() { return "uninterpretable response"; } };

/// @brief A remote call failed before a complete response was received.
struct network_failure { static constexpr const char* string() { return "network failure"; } };

/// @brief A required setting (environment variable, option) is missing.
struct missing_configuration { static constexpr const char* string() { return "missing configuration"; } };

/// @brief An internal invariant was broken.
struct program_logic { static constexpr const char* string() { return "program logic error"; } };

} // namespace receiptwire::errors

#endif // RECEIPTWIRE_ERROR_TAGS_H
