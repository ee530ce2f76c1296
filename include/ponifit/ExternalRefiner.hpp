#pragma once
#include "CalibrationDataset.hpp"
#include "GeometryModel.hpp"
#include "PoseParameters.hpp"
#include <iosfwd>
#include <string>

namespace ponifit {

/* ------------------------------------------------------------------------- */
/*  Delegate that proposes a pose using some program outside this library.   */
/*  Implementations throw ExternalToolError instead of returning the start   */
/*  pose when they could not produce anything.                               */
/* ------------------------------------------------------------------------- */
class ExternalRefiner {
public:
    virtual ~ExternalRefiner() = default;

    virtual PoseParameters refine(const PoseParameters&     pose,
                                  const CalibrationDataset& dataset,
                                  const GeometryModel&      geometry) = 0;
};

/* result of reading the legacy tool's standard output */
struct ToolReport {
    PoseParameters pose;
    int            recognised = 0;   // number of key/value lines used
};

/*  Lines splitting into exactly three tokens  <name> <value> <unit>  with
 *  name in {cen1, cen2, dis, rot1, rot2, rot3} update the start pose; the
 *  centre is reported in pixels and converted back to metres.  Every other
 *  line is ignored.  A recognised key with a non-numeric value throws.     */
ToolReport parse_tool_report(std::istream&         out,
                             const PoseParameters& start,
                             double                pixel1,
                             double                pixel2);

/* ------------------------------------------------------------------------- */
/*  Adapter for the legacy "roca" command line refiner.                      */
/*                                                                           */
/*  The observations are written to a scoped temporary file as               */
/*      <ring 2θ> <pixel0> <pixel1>                                          */
/*  and the tool is run as                                                   */
/*      roca debug=8 maxdev=1 input=<file> px1 px2 poni1/px1 poni2/px2       */
/*           dist rot1 rot2 rot3                                             */
/*  Standard output is read to the end; there is no timeout.                 */
/* ------------------------------------------------------------------------- */
class LegacyToolRefiner : public ExternalRefiner {
public:
    explicit LegacyToolRefiner(std::string executable = "/opt/saxs/roca",
                               bool        verbose    = false);

    PoseParameters refine(const PoseParameters&     pose,
                          const CalibrationDataset& dataset,
                          const GeometryModel&      geometry) override;

    const std::string& executable() const { return executable_; }

private:
    std::string executable_;
    bool        verbose_;
};

} // namespace ponifit
