/**
 * @file Version.h
 * @brief Ember API version.
 */

#ifndef EMBER_VERSION_H_
#define EMBER_VERSION_H_

#include <sstream>
#include <string>

#define EMBER_VERSION_MAJOR 0
#define EMBER_VERSION_MINOR 1
#define EMBER_VERSION_PATCH 0
#define EMBER_VERSION_PRERELEASE_TAG "alpha"
#define EMBER_VERSION_PRERELEASE 1

namespace Ember
{
    /**
     * @brief Semantic version data.
     */
    struct Version
    {
    public:
        Version( int major, int minor, int patch, const std::string& prerelease_tag = "", int prerelease = 0 )
            : major_( major ), minor_( minor ), patch_( patch ), pre_release_tag_( prerelease_tag ), pre_release_( prerelease )
        {
        }

        std::string toString() const
        {
            std::stringstream ss;

            ss << major_ << "." << minor_ << "." << patch_;

            if (!pre_release_tag_.empty())
            {
                ss << "-" << pre_release_tag_ << "." << pre_release_;
            }

            return ss.str();
        }

        int getMajor() const { return major_; }
        int getMinor() const { return minor_; }
        int getPatch() const { return patch_; }

    private:
        int major_;
        int minor_;
        int patch_;
        std::string pre_release_tag_;
        int pre_release_;
    };
}

#endif
