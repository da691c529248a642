#pragma once

/**
 * @file Fixtures.hpp
 * @brief Synthetic LS-DYNA result-file text for reader and pipeline tests
 *
 * Each builder emits the layout the corresponding reader expects, trimmed
 * to the fields the tests need.
 */

#include <cstdio>
#include <string>
#include <vector>

namespace dynadiag::fixtures {

/// Solver-style scientific notation, "1.000000E-03"
inline std::string Sci(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.6E", v);
    return buf;
}

// =============================================================================
// glstat
// =============================================================================

struct GlstatBlock {
    long cycle = 0;
    double time = 0.0;
    double dt = 1e-6;
    double kinetic = 100.0;
    double internal = 1000.0;
    double hourglass = 0.0;
    double sliding = 0.0;
    double ratio = 1.0;
    long element = 101;
    long part = 1;
};

/// One energy block, opened by its controlling-element line
inline std::string GlstatText(const GlstatBlock &b) {
    double total = b.kinetic + b.internal + b.hourglass + b.sliding;
    std::string s;
    s += " dt of cycle " + std::to_string(b.cycle) + " is controlled by solid " +
         std::to_string(b.element) + " of part " + std::to_string(b.part) + "\n\n";
    s += " time...........................   " + Sci(b.time) + "\n";
    s += " time step......................   " + Sci(b.dt) + "\n";
    s += " kinetic energy.................   " + Sci(b.kinetic) + "\n";
    s += " internal energy................   " + Sci(b.internal) + "\n";
    s += " hourglass energy ..............   " + Sci(b.hourglass) + "\n";
    s += " sliding interface energy.......   " + Sci(b.sliding) + "\n";
    s += " total energy...................   " + Sci(total) + "\n";
    s += " total energy / initial energy..   " + Sci(b.ratio) + "\n\n";
    return s;
}

inline std::string GlstatText(const std::vector<GlstatBlock> &blocks) {
    std::string s = " Global statistics output\n\n";
    for (const auto &b : blocks) {
        s += GlstatText(b);
    }
    return s;
}

/// Ten healthy blocks, cycles 0..900
inline std::vector<GlstatBlock> HealthyGlstat() {
    std::vector<GlstatBlock> blocks;
    for (int i = 0; i < 10; ++i) {
        GlstatBlock b;
        b.cycle = i * 100;
        b.time = i * 1e-3;
        b.kinetic = 100.0 + i;
        b.internal = 1000.0 + 10.0 * i;
        b.hourglass = 10.0;
        blocks.push_back(b);
    }
    return blocks;
}

// =============================================================================
// d3hsp
// =============================================================================

/// Everything up to and including the contact summary
inline std::string HspPreamble(int procs = 4) {
    std::string s;
    s += " **********************************************************************\n";
    s += " |  Version : mpp d R13.1.1                                           |\n";
    s += " |  Revision: 167110                                                  |\n";
    s += " |  Precision : double                                                |\n";
    s += " **********************************************************************\n";
    s += "    Date:  01/15/2024    Time: 10:22:11\n";
    s += " Input file: model.k\n";
    s += " MPP execution with " + std::to_string(procs) + " procs\n\n";

    s += " c o n t r o l   i n f o r m a t i o n\n\n";
    s += " number of materials or property sets.......     2\n";
    s += " number of nodal+scalar points..............  1000\n";
    s += " number of solid elements...................   500\n";
    s += " number of shell elements...................   200\n";
    s += " total # of *PART_option card...............     2\n";
    s += " total # of *CONTACT_AUTOMATIC_SINGLE_SURFACE.....     1\n\n";

    s += " c o m p u t a t i o n   o p t i o n s\n\n";
    s += " termination time...........................  1.0000E-02\n";
    s += " time step scale factor.....................  9.0000E-01\n";
    s += " time step size for mass scaled solution....  0.0000E+00\n\n";

    s += " p a r t   d e f i n i t i o n s\n\n";
    s += " part id ...................        1\n";
    s += " section id ................        1\n";
    s += " material id ...............        1\n";
    s += " material type .............       24\n";
    s += " density ...................=  7.8500E-09\n";
    s += " part id ...................        2\n";
    s += " section id ................        2\n";
    s += " material id ...............        2\n";
    s += " material type .............        1\n\n";

    s += " c o n t a c t   i n t e r f a c e s\n\n";
    s += " Contact summary\n";
    s += "   Order #    Id    Type    Title\n";
    s += "       1       1    a 13    body_self\n";
    s += " ********************************************************************************\n\n";

    s += " m a s s   p r o p e r t i e s   o f   p a r t   #       1\n";
    s += "   total mass of part  =   1.0000E+00\n";
    s += "   x-coordinate of mass center =   0.0000E+00\n\n";
    return s;
}

/// Interface surface timestep table with one inactive surface, and the contact dt ceiling
inline std::string HspContactStability() {
    std::string s;
    s += " i n t e r f a c e   s u r f a c e   t i m e s t e p s\n\n";
    s += "  interface  surface    type    timestep      node    part\n";
    s += "          1    surfa    a 13   2.5000E-07     1001       1\n";
    s += "          1    surfb    a 13   1.0000E+16        0       0\n";
    s += "          2    SURFA       4   1.2000E-07     2002       2\n\n";
    s += " contact stability: recommended time step <=  1.0000E-07\n\n";
    return s;
}

/// Solution phase: two energy blocks and the smallest-timestep table
inline std::string HspSolution() {
    std::string s;
    for (int i = 0; i < 2; ++i) {
        s += " dt of cycle " + std::to_string(i * 1000) + " is controlled by solid 101 of part 1\n";
        s += " time...........................   " + Sci(i * 5e-3) + "\n";
        s += " time step......................   " + Sci(1e-6) + "\n";
        s += " kinetic energy.................   " + Sci(100.0) + "\n";
        s += " internal energy................   " + Sci(1000.0) + "\n";
        s += " hourglass energy ..............   " + Sci(10.0) + "\n";
        s += " total energy...................   " + Sci(1110.0) + "\n";
        s += " total energy / initial energy..   " + Sci(1.0) + "\n\n";
    }
    s += " 100 smallest timesteps\n";
    s += " ----------------------\n";
    s += " element type    number    part   timestep\n";
    s += "   solid          101         1   1.0000E-06\n";
    s += "   solid          102         1   1.1000E-06\n";
    s += "   shell          201         2   2.0000E-06\n\n";
    return s;
}

/// Timing and CPU tables, balanced over `procs` ranks
inline std::string HspTail(int procs = 4) {
    std::string s;
    s += " T i m i n g   i n f o r m a t i o n\n";
    s += "                        CPU(seconds)   %CPU  Clock(seconds) %Clock\n";
    s += "  ----------------------------------------------------------------\n";
    s += "  Keyword Processing ...  1.0000E+00   0.83  1.0000E+00   0.80\n";
    s += "  Element processing ...  6.0000E+01  50.00  6.2000E+01  49.60\n";
    s += "    Solids .............  6.0000E+01  50.00  6.2000E+01  49.60\n";
    s += "  Contact algorithm ....  4.0000E+01  33.33  4.2000E+01  33.60\n";
    s += "    Interf. ID         1  4.0000E+01  33.33  4.2000E+01  33.60\n";
    s += "  Element sharing ......  1.9000E+01  15.84  2.0000E+01  16.00\n";
    s += "  T o t a l s            1.2000E+02 100.00  1.2500E+02 100.00\n\n";
    s += " C P U   T i m i n g   i n f o r m a t i o n\n";
    s += "  Processor   Hostname                     CPU/Avg_CPU  CPU(seconds)\n";
    s += "  ---------------------------------------------------------------------------\n";
    for (int r = 0; r < procs; ++r) {
        double seconds = r % 2 == 0 ? 121.0 : 119.0;
        char ratio[16];
        std::snprintf(ratio, sizeof(ratio), "%.4f", seconds / 120.0);
        s += "  #  " + std::to_string(r) + "     node01    " + ratio + "   " + Sci(seconds) + "\n";
    }
    s += "  T o t a l s                                             4.8000E+02\n\n";
    return s;
}

/// Full d3hsp of a run that reached its termination time
inline std::string HspNormalRun(int procs = 4) {
    std::string s = HspPreamble(procs) + HspSolution();
    s += " N o r m a l    t e r m i n a t i o n                   01/15/2024 10:25:00\n\n";
    s += " Problem time       =    1.0000E-02\n";
    s += " Problem cycle      =      2000\n";
    s += " Total CPU time     =       120 seconds (   0 hours  2 minutes  0 seconds)\n";
    s += " Elapsed time     125 seconds for    2000 cycles using  4 MPP procs\n\n";
    s += HspTail(procs);
    return s;
}

/// Full d3hsp of a run stopped by a negative-volume error
inline std::string HspErrorRun(int procs = 4) {
    std::string s = HspPreamble(procs) + HspSolution();
    s += " *** Error 30010 (ELE+10)\n";
    s += "     negative volume in solid element 101 cycle 1500\n\n";
    s += " E r r o r   t e r m i n a t i o n                     01/15/2024 10:24:00\n\n";
    s += " Problem time       =    7.5000E-03\n";
    s += " Problem cycle      =      1500\n";
    s += " Elapsed time      90 seconds for    1500 cycles using  4 MPP procs\n\n";
    s += HspTail(procs);
    return s;
}

// =============================================================================
// Message logs
// =============================================================================

/// One coded warning block naming an element
inline std::string MessageWarning(int code, long element) {
    return " *** Warning " + std::to_string(code) + " (SOL+135)\n" +
           "     tracked node not constrained for element " + std::to_string(element) + "\n\n";
}

inline std::string MessagLog() {
    std::string s;
    s += MessageWarning(50135, 1001);
    s += "     12 initial penetrations were found for interface 1\n\n";
    s += " Summary of warning messages for interface # =       1\n";
    s += "     number of warning messages =     3\n\n";
    s += " N o r m a l    t e r m i n a t i o n\n";
    return s;
}

// =============================================================================
// status.out, matsum
// =============================================================================

inline std::string StatusText() {
    std::string s;
    for (int i = 1; i <= 4; ++i) {
        s += "      " + std::to_string(i * 500) + " t " + Sci(i * 2.5e-3) + " dt " + Sci(1e-6) +
             " flush i/o\n";
    }
    s += " estimated total cpu time          =       120 sec (      0 hrs  2 mins)\n";
    return s;
}

struct MatsumPart {
    long part = 1;
    double internal = 1000.0;
    double kinetic = 100.0;
    double hourglass = 5.0;
};

inline std::string MatsumText(const std::vector<MatsumPart> &parts, int states = 2) {
    std::string s;
    s += " {BEGIN LEGEND}\n";
    s += " Entity #        Title\n";
    s += "       1     body\n";
    s += "       2     plate\n";
    s += " {END LEGEND}\n\n";
    for (int state = 0; state < states; ++state) {
        s += " time =  " + Sci(state * 5e-3) + "\n";
        for (const auto &p : parts) {
            s += " mat.#=    " + std::to_string(p.part) + "   inten=   " + Sci(p.internal) +
                 "     kinen=   " + Sci(p.kinetic) + "     eroded_ie=   " + Sci(0.0) +
                 "  eroded_ke=   " + Sci(0.0) + "\n";
            s += " x-mom=   " + Sci(0.0) + "    y-mom=   " + Sci(0.0) + "    z-mom=   " +
                 Sci(0.0) + "\n";
            s += " x-rbv=   " + Sci(0.0) + "    y-rbv=   " + Sci(0.0) + "    z-rbv=   " +
                 Sci(0.0) + "\n";
            s += " hgeng=   " + Sci(p.hourglass) + "    eroded_he=   " + Sci(0.0) + "\n";
        }
        s += "\n";
    }
    return s;
}

// =============================================================================
// nodout, bndout
// =============================================================================

struct NodoutRow {
    long node = 1;
    double vx = 0.0;
    double vy = 0.0;
    double vz = 0.0;
};

/// One nodout state with the given rows
inline std::string NodoutState(int step, double time, const std::vector<NodoutRow> &rows) {
    std::string s;
    s += " n o d a l   p r i n t   o u t   f o r   t i m e  s t e p " + std::to_string(step) +
         "                              ( at time " + Sci(time) + " )\n\n";
    s += " nodal point  x-disp     y-disp      z-disp      x-vel       y-vel       z-vel      "
         "x-accl      y-accl      z-accl      x-coor      y-coor      z-coor\n";
    for (const auto &r : rows) {
        s += "   " + std::to_string(r.node);
        for (double v : {0.0, 0.0, 0.0, r.vx, r.vy, r.vz, 0.0, 0.0, 0.0, 1.0, 2.0, 3.0}) {
            s += " " + Sci(v);
        }
        s += "\n";
    }
    s += "\n";
    return s;
}

/// One bndout state with a single node row
inline std::string BndoutState(double time, long node, double fx) {
    std::string s;
    s += " n o d a l   f o r c e / e n e r g y    o u t p u t  t=   " + Sci(time) + "\n";
    s += " nd#   " + std::to_string(node) + "  xforce=   " + Sci(fx) + "   yforce=   " + Sci(0.0) +
         "   zforce=   " + Sci(0.0) + "   energy=   " + Sci(0.0) + "\n\n";
    return s;
}

// =============================================================================
// Profiles and deck
// =============================================================================

/// load_profile.csv with one row per rank
inline std::string LoadProfileText(const std::vector<double> &element_seconds) {
    std::string s = "\"Clock (seconds)\"\n";
    s += "Solids,Shells,Beams,Contact,Rigid,Init,Io,Misc,Other,Spare1,Spare2,Spare3,Spare4,"
         "Spare5,Total\n";
    for (double v : element_seconds) {
        s += std::to_string(v);
        for (int c = 1; c < 15; ++c) {
            s += ",1.0";
        }
        s += "\n";
    }
    s += "\n";
    return s;
}

/// cont_profile.csv for interface 1, one row per rank
inline std::string ContactProfileText(const std::vector<double> &seconds) {
    std::string s = "\"Clock (seconds)\"\n1\n";
    for (double v : seconds) {
        s += std::to_string(v) + "\n";
    }
    s += "\n";
    return s;
}

inline std::string DeckText() {
    std::string s;
    s += "*KEYWORD\n";
    s += "*ELEMENT_SOLID\n";
    s += "$#   eid     pid      n1      n2      n3      n4      n5      n6      n7      n8\n";
    s += "     101       1       1       2       3       4       5       6       7       8\n";
    s += "     102       1       5       6       7       8       9      10      11      12\n";
    s += "*ELEMENT_SHELL\n";
    s += "     201       2      21      22      23      24\n";
    s += "*END\n";
    return s;
}

} // namespace dynadiag::fixtures
