/**
 * @file KnowledgeBase.cpp
 * @brief Built-in code catalogue
 */

#include <dynadiag/model/KnowledgeBase.hpp>

namespace dynadiag {

namespace {

struct Entry {
    int code;
    const char *category;
    FindingSeverity severity;
    const char *title;
    const char *description;
    const char *recommendation;
};

constexpr auto W = FindingSeverity::Warning;
constexpr auto C = FindingSeverity::Critical;

// clang-format off
const Entry kCatalogue[] = {
    // Contact and tied interfaces
    {50135, "contact", W, "Tracked node not constrained (tied interface)",
     "A slave node of a tied interface found no master segment and stays unconstrained.",
     "Check mesh compatibility between tied parts, keep slave nodes within projection "
     "distance of the master surface, or use SBOPT=3 and DEPTH=5 on *CONTACT."},
    {50136, "contact", W, "Tracked node too far from segment",
     "A tied slave node lies beyond the search tolerance of the nearest master segment.",
     "Increase the tied search distance (SFACT) or close geometric gaps between the surfaces."},
    {50120, "contact", W, "Contact segment normals inconsistent",
     "Segment normals of a contact surface are inconsistent or reversed.",
     "Check segment orientation and SSTYP/MSTYP settings; verify segment connectivity."},
    {20248, "contact", W, "Initial penetration in contact",
     "Nodes start the run penetrating a contact surface, which injects energy at startup.",
     "Remove the overlaps in the mesh, or set IGNORE=1/2 or PENOPT in *CONTROL_CONTACT."},
    {20200, "contact", W, "Contact interface has no segments",
     "A contact definition resolved to an empty segment set.",
     "Verify that the segment sets reference the intended part or set ids."},

    // Element distortion
    {30010, "element", C, "Negative volume (error termination)",
     "An element inverted and the solver terminated.",
     "Add *MAT_ADD_EROSION or ERODE=1 with a TSMIN in *CONTROL_TIMESTEP, and improve the "
     "mesh in the reported region."},
    {40003, "element", C, "Negative volume in element",
     "An element developed negative volume during the solution.",
     "Inspect element quality near the reported element; add erosion or lower TSSFAC."},
    {40004, "element", C, "Negative volume in shell element",
     "A shell element developed negative area.",
     "Check shell deformation and thickness; add erosion or raise the shell TSMIN."},
    {40509, "element", W, "Negative volume warning",
     "A solid element reached negative volume and was recovered or eroded.",
     "Repeated occurrences precede error termination. Refine or smooth the mesh, or "
     "switch the affected parts to a more robust element formulation."},
    {40100, "element", W, "Degenerate element detected",
     "An element has a very poor aspect ratio or is degenerate.",
     "Remesh the affected region; *CONTROL_CHECK reports quality before the run."},

    // Numerical divergence
    {30200, "numerical", C, "NaN velocity detected",
     "A velocity became NaN; the solution has diverged.",
     "Look for zero-volume elements, excessive mass scaling or contact instabilities, and "
     "reduce TSSFAC."},
    {30100, "numerical", C, "NaN in stress calculation",
     "A stress evaluation produced NaN.",
     "Check that density, modulus and yield stress are non-zero and physical."},
    {30358, "numerical", C, "Constraint matrix singular or NaN",
     "The constraint matrix contains NaN or is singular, usually after energy divergence.",
     "Look for over-constrained nodes (SPC plus rigid or tied) and for the energy "
     "divergence that preceded it."},

    // Memory
    {10103, "memory", C, "Out of memory",
     "The solver ran out of its allocated memory.",
     "Raise memory= and memory2= on the command line, or run on more ranks."},
    {10100, "memory", C, "Insufficient memory for decomposition",
     "Not enough memory was available for the MPP decomposition.",
     "Increase the memory allocation, for example memory=200m memory2=200m."},

    // Timestep and materials
    {30001, "timestep", W, "Element timestep below minimum",
     "An element timestep fell below TSMIN.",
     "Review TSMIN and ERODE in *CONTROL_TIMESTEP and how many elements are eroding."},
    {41200, "material", W, "Material failure criterion met",
     "A material failure criterion was activated.",
     "Check the failure strain or stress values and whether the failure model fits the load."},
    {60100, "rigid", W, "Rigid body mass too small",
     "A rigid body has a very small mass.",
     "Check the rigid material density and geometry."},
    {70100, "adaptive", W, "Adaptive remeshing issue",
     "Adaptive remeshing reported a problem.",
     "Check the adaptivity parameters and refinement levels."},
    {80100, "sph", W, "SPH particle issue",
     "SPH particle computation reported a problem.",
     "Check SPH parameters and particle distribution."},
    {90001, "license", C, "License error",
     "The solver license could not be acquired or has expired.",
     "Check LSTC_LICENSE_SERVER and the license file."},
};
// clang-format on

} // namespace

const KnowledgeBase &KnowledgeBase::Instance() {
    static const KnowledgeBase instance;
    return instance;
}

KnowledgeBase::KnowledgeBase() {
    for (const auto &e : kCatalogue) {
        entries_.emplace(e.code, CodeInfo{.code = e.code,
                                          .category = e.category,
                                          .severity = e.severity,
                                          .title = e.title,
                                          .description = e.description,
                                          .recommendation = e.recommendation,
                                          .catalogued = true});
    }
}

CodeInfo KnowledgeBase::Lookup(int code) const {
    if (auto it = entries_.find(code); it != entries_.end()) {
        return it->second;
    }
    FindingSeverity severity = FindingSeverity::Info;
    if (code < 20000) {
        severity = FindingSeverity::Critical;
    } else if (code < 60000) {
        severity = FindingSeverity::Warning;
    }
    return CodeInfo{.code = code,
                    .category = "uncatalogued",
                    .severity = severity,
                    .title = "Code " + std::to_string(code),
                    .description = "Code " + std::to_string(code) +
                                   " is not in the built-in catalogue.",
                    .recommendation = "Consult the solver manual for code " +
                                      std::to_string(code) + ".",
                    .catalogued = false};
}

} // namespace dynadiag
