/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 *
 * SGP4 Satellite Propagation Implementation
 * Based on the Vallado reference implementation from CelesTrak.
 * See: https://celestrak.org/software/vallado-sw.php
 */

#include <skypass/sgp4.hpp>

#include <cmath>
#include <numbers>

namespace skypass::sgp4 {

namespace {

constexpr double PI = std::numbers::pi;

// Lunar and solar constants shared by the deep-space routines
constexpr double ZES = 0.01675;
constexpr double ZEL = 0.05490;
constexpr double ZNS = 1.19459e-5;
constexpr double ZNL = 1.5835218e-4;

// Earth rotation rate (rad/min) used by the resonance terms
constexpr double RPTIM = 4.37526908801129966e-3;

/**
 * Solar (or lunar) coupling terms for one perturbing body.
 */
struct ThirdBody {
    double s1, s2, s3, s4, s5, s6, s7;
    double z1, z2, z3;
    double z11, z12, z13;
    double z21, z22, z23;
    double z31, z32, z33;
};

struct ThirdBodyTerms {
    ThirdBody solar;
    ThirdBody lunar;
    double sinim, cosim;
    double emsq;
};

/**
 * Lunar-solar terms at epoch (Vallado's dscom). Fills the periodic
 * coefficients of the deep-space block.
 */
ThirdBodyTerms thirdBodyTerms(double epoch, double ep, double argpp, double inclp,
                              double nodep, double np, DeepSpace& ds) {
    constexpr double c1ss = 2.9864797e-6;
    constexpr double c1l = 4.7968065e-7;
    constexpr double zsinis = 0.39785416;
    constexpr double zcosis = 0.91744867;
    constexpr double zcosgs = 0.1945905;
    constexpr double zsings = -0.98088458;

    ThirdBodyTerms terms;
    double snodm = std::sin(nodep);
    double cnodm = std::cos(nodep);
    double sinomm = std::sin(argpp);
    double cosomm = std::cos(argpp);
    terms.sinim = std::sin(inclp);
    terms.cosim = std::cos(inclp);
    terms.emsq = ep * ep;
    double betasq = 1.0 - terms.emsq;
    double rtemsq = std::sqrt(betasq);

    // Days since 1900 January 0.5
    double day = epoch + 18261.5;
    double xnodce = std::fmod(4.5236020 - 9.2422029e-4 * day, TWO_PI);
    double stem = std::sin(xnodce);
    double ctem = std::cos(xnodce);
    double zcosil = 0.91375164 - 0.03568096 * ctem;
    double zsinil = std::sqrt(1.0 - zcosil * zcosil);
    double zsinhl = 0.089683511 * stem / zsinil;
    double zcoshl = std::sqrt(1.0 - zsinhl * zsinhl);
    double gam = 5.8351514 + 0.0019443680 * day;
    double zx = 0.39785416 * stem / zsinil;
    double zy = zcoshl * ctem + 0.91744867 * zsinhl * stem;
    zx = std::atan2(zx, zy);
    zx = gam + zx - xnodce;
    double zcosgl = std::cos(zx);
    double zsingl = std::sin(zx);

    // The sun first, then the moon
    double zcosg = zcosgs, zsing = zsings;
    double zcosi = zcosis, zsini = zsinis;
    double zcosh = cnodm, zsinh = snodm;
    double cc = c1ss;
    double xnoi = 1.0 / np;

    for (ThirdBody* body : {&terms.solar, &terms.lunar}) {
        double a1 = zcosg * zcosh + zsing * zcosi * zsinh;
        double a3 = -zsing * zcosh + zcosg * zcosi * zsinh;
        double a7 = -zcosg * zsinh + zsing * zcosi * zcosh;
        double a8 = zsing * zsini;
        double a9 = zsing * zsinh + zcosg * zcosi * zcosh;
        double a10 = zcosg * zsini;
        double a2 = terms.cosim * a7 + terms.sinim * a8;
        double a4 = terms.cosim * a9 + terms.sinim * a10;
        double a5 = -terms.sinim * a7 + terms.cosim * a8;
        double a6 = -terms.sinim * a9 + terms.cosim * a10;

        double x1 = a1 * cosomm + a2 * sinomm;
        double x2 = a3 * cosomm + a4 * sinomm;
        double x3 = -a1 * sinomm + a2 * cosomm;
        double x4 = -a3 * sinomm + a4 * cosomm;
        double x5 = a5 * sinomm;
        double x6 = a6 * sinomm;
        double x7 = a5 * cosomm;
        double x8 = a6 * cosomm;

        ThirdBody& b = *body;
        double emsq = terms.emsq;
        b.z31 = 12.0 * x1 * x1 - 3.0 * x3 * x3;
        b.z32 = 24.0 * x1 * x2 - 6.0 * x3 * x4;
        b.z33 = 12.0 * x2 * x2 - 3.0 * x4 * x4;
        b.z1 = 3.0 * (a1 * a1 + a2 * a2) + b.z31 * emsq;
        b.z2 = 6.0 * (a1 * a3 + a2 * a4) + b.z32 * emsq;
        b.z3 = 3.0 * (a3 * a3 + a4 * a4) + b.z33 * emsq;
        b.z11 = -6.0 * a1 * a5 + emsq * (-24.0 * x1 * x7 - 6.0 * x3 * x5);
        b.z12 = -6.0 * (a1 * a6 + a3 * a5) + emsq * (-24.0 * (x2 * x7 + x1 * x8) - 6.0 * (x3 * x6 + x4 * x5));
        b.z13 = -6.0 * a3 * a6 + emsq * (-24.0 * x2 * x8 - 6.0 * x4 * x6);
        b.z21 = 6.0 * a2 * a5 + emsq * (24.0 * x1 * x5 - 6.0 * x3 * x7);
        b.z22 = 6.0 * (a4 * a5 + a2 * a6) + emsq * (24.0 * (x2 * x5 + x1 * x6) - 6.0 * (x4 * x7 + x3 * x8));
        b.z23 = 6.0 * a4 * a6 + emsq * (24.0 * x2 * x6 - 6.0 * x4 * x8);
        b.z1 = b.z1 + b.z1 + betasq * b.z31;
        b.z2 = b.z2 + b.z2 + betasq * b.z32;
        b.z3 = b.z3 + b.z3 + betasq * b.z33;
        b.s3 = cc * xnoi;
        b.s2 = -0.5 * b.s3 / rtemsq;
        b.s4 = b.s3 * rtemsq;
        b.s1 = -15.0 * ep * b.s4;
        b.s5 = x1 * x3 + x2 * x4;
        b.s6 = x2 * x3 + x1 * x4;
        b.s7 = x2 * x4 - x1 * x3;

        zcosg = zcosgl;
        zsing = zsingl;
        zcosi = zcosil;
        zsini = zsinil;
        zcosh = zcoshl * cnodm + zsinhl * snodm;
        zsinh = snodm * zcoshl - cnodm * zsinhl;
        cc = c1l;
    }

    ds.zmol = std::fmod(4.7199672 + 0.22997150 * day - gam, TWO_PI);
    ds.zmos = std::fmod(6.2565837 + 0.017201977 * day, TWO_PI);

    const ThirdBody& s = terms.solar;
    ds.se2 = 2.0 * s.s1 * s.s6;
    ds.se3 = 2.0 * s.s1 * s.s7;
    ds.si2 = 2.0 * s.s2 * s.z12;
    ds.si3 = 2.0 * s.s2 * (s.z13 - s.z11);
    ds.sl2 = -2.0 * s.s3 * s.z2;
    ds.sl3 = -2.0 * s.s3 * (s.z3 - s.z1);
    ds.sl4 = -2.0 * s.s3 * (-21.0 - 9.0 * terms.emsq) * ZES;
    ds.sgh2 = 2.0 * s.s4 * s.z32;
    ds.sgh3 = 2.0 * s.s4 * (s.z33 - s.z31);
    ds.sgh4 = -18.0 * s.s4 * ZES;
    ds.sh2 = -2.0 * s.s2 * s.z22;
    ds.sh3 = -2.0 * s.s2 * (s.z23 - s.z21);

    const ThirdBody& l = terms.lunar;
    ds.ee2 = 2.0 * l.s1 * l.s6;
    ds.e3 = 2.0 * l.s1 * l.s7;
    ds.xi2 = 2.0 * l.s2 * l.z12;
    ds.xi3 = 2.0 * l.s2 * (l.z13 - l.z11);
    ds.xl2 = -2.0 * l.s3 * l.z2;
    ds.xl3 = -2.0 * l.s3 * (l.z3 - l.z1);
    ds.xl4 = -2.0 * l.s3 * (-21.0 - 9.0 * terms.emsq) * ZEL;
    ds.xgh2 = 2.0 * l.s4 * l.z32;
    ds.xgh3 = 2.0 * l.s4 * (l.z33 - l.z31);
    ds.xgh4 = -18.0 * l.s4 * ZEL;
    ds.xh2 = -2.0 * l.s2 * l.z22;
    ds.xh3 = -2.0 * l.s2 * (l.z23 - l.z21);

    return terms;
}

/**
 * Secular rates and resonance set-up (Vallado's dsinit).
 */
void initializeDeepSpace(Coefficients& c, const ThirdBodyTerms& terms, double xpidot) {
    constexpr double q22 = 1.7891679e-6;
    constexpr double q31 = 2.1460748e-6;
    constexpr double q33 = 2.2123015e-7;
    constexpr double root22 = 1.7891679e-6;
    constexpr double root32 = 3.7393792e-7;
    constexpr double root44 = 7.3636953e-9;
    constexpr double root52 = 1.1428639e-7;
    constexpr double root54 = 2.1765803e-9;

    DeepSpace& ds = c.deep;
    const ThirdBody& s = terms.solar;
    const ThirdBody& l = terms.lunar;
    double nm = c.no_unkozai;
    double em = c.ecco;
    double emsq = terms.emsq;
    double sinim = terms.sinim;
    double cosim = terms.cosim;

    if (nm < 0.0052359877 && nm > 0.0034906585) {
        ds.irez = 1;
    }
    if (nm >= 8.26e-3 && nm <= 9.24e-3 && em >= 0.5) {
        ds.irez = 2;
    }

    // Nodal terms vanish for near-equatorial orbits
    bool equatorial = c.inclo < 5.2359877e-2 || c.inclo > PI - 5.2359877e-2;

    double ses = s.s1 * ZNS * s.s5;
    double sis = s.s2 * ZNS * (s.z11 + s.z13);
    double sls = -ZNS * s.s3 * (s.z1 + s.z3 - 14.0 - 6.0 * emsq);
    double sghs = s.s4 * ZNS * (s.z31 + s.z33 - 6.0);
    double shs = equatorial ? 0.0 : -ZNS * s.s2 * (s.z21 + s.z23);
    if (sinim != 0.0) {
        shs = shs / sinim;
    }
    double sgs = sghs - cosim * shs;

    ds.dedt = ses + l.s1 * ZNL * l.s5;
    ds.didt = sis + l.s2 * ZNL * (l.z11 + l.z13);
    ds.dmdt = sls - ZNL * l.s3 * (l.z1 + l.z3 - 14.0 - 6.0 * emsq);
    double sghl = l.s4 * ZNL * (l.z31 + l.z33 - 6.0);
    double shll = equatorial ? 0.0 : -ZNL * l.s2 * (l.z21 + l.z23);
    ds.domdt = sgs + sghl;
    ds.dnodt = shs;
    if (sinim != 0.0) {
        ds.domdt = ds.domdt - cosim / sinim * shll;
        ds.dnodt = ds.dnodt + shll / sinim;
    }

    if (ds.irez == 0) {
        return;
    }

    double theta = std::fmod(c.gsto, TWO_PI);
    double aonv = std::pow(nm / XKE, X2O3);

    if (ds.irez == 2) {
        // Geopotential resonance for 12 hour orbits
        double cosisq = cosim * cosim;
        double eoc = em * emsq;
        double g201 = -0.306 - (em - 0.64) * 0.440;
        double g211, g310, g322, g410, g422, g520, g521, g532, g533;
        if (em <= 0.65) {
            g211 = 3.616 - 13.2470 * em + 16.2900 * emsq;
            g310 = -19.302 + 117.3900 * em - 228.4190 * emsq + 156.5910 * eoc;
            g322 = -18.9068 + 109.7927 * em - 214.6334 * emsq + 146.5816 * eoc;
            g410 = -41.122 + 242.6940 * em - 471.0940 * emsq + 313.9530 * eoc;
            g422 = -146.407 + 841.8800 * em - 1629.014 * emsq + 1083.4350 * eoc;
            g520 = -532.114 + 3017.977 * em - 5740.032 * emsq + 3708.2760 * eoc;
        } else {
            g211 = -72.099 + 331.819 * em - 508.738 * emsq + 266.724 * eoc;
            g310 = -346.844 + 1582.851 * em - 2415.925 * emsq + 1246.113 * eoc;
            g322 = -342.585 + 1554.908 * em - 2366.899 * emsq + 1215.972 * eoc;
            g410 = -1052.797 + 4758.686 * em - 7193.992 * emsq + 3651.957 * eoc;
            g422 = -3581.690 + 16178.110 * em - 24462.770 * emsq + 12422.520 * eoc;
            if (em > 0.715) {
                g520 = -5149.66 + 29936.92 * em - 54087.36 * emsq + 31324.56 * eoc;
            } else {
                g520 = 1464.74 - 4664.75 * em + 3763.64 * emsq;
            }
        }
        if (em < 0.7) {
            g533 = -919.22770 + 4988.6100 * em - 9064.7700 * emsq + 5542.21 * eoc;
            g521 = -822.71072 + 4568.6173 * em - 8491.4146 * emsq + 5337.524 * eoc;
            g532 = -853.66600 + 4690.2500 * em - 8624.7700 * emsq + 5341.4 * eoc;
        } else {
            g533 = -37995.780 + 161616.52 * em - 229838.20 * emsq + 109377.94 * eoc;
            g521 = -51752.104 + 218913.95 * em - 309468.16 * emsq + 146349.42 * eoc;
            g532 = -40023.880 + 170470.89 * em - 242699.48 * emsq + 115605.82 * eoc;
        }

        double sini2 = sinim * sinim;
        double f220 = 0.75 * (1.0 + 2.0 * cosim + cosisq);
        double f221 = 1.5 * sini2;
        double f321 = 1.875 * sinim * (1.0 - 2.0 * cosim - 3.0 * cosisq);
        double f322 = -1.875 * sinim * (1.0 + 2.0 * cosim - 3.0 * cosisq);
        double f441 = 35.0 * sini2 * f220;
        double f442 = 39.3750 * sini2 * sini2;
        double f522 = 9.84375 * sinim * (sini2 * (1.0 - 2.0 * cosim - 5.0 * cosisq)
                    + 0.33333333 * (-2.0 + 4.0 * cosim + 6.0 * cosisq));
        double f523 = sinim * (4.92187512 * sini2 * (-2.0 - 4.0 * cosim + 10.0 * cosisq)
                    + 6.56250012 * (1.0 + 2.0 * cosim - 3.0 * cosisq));
        double f542 = 29.53125 * sinim * (2.0 - 8.0 * cosim + cosisq * (-12.0 + 8.0 * cosim + 10.0 * cosisq));
        double f543 = 29.53125 * sinim * (-2.0 - 8.0 * cosim + cosisq * (12.0 + 8.0 * cosim - 10.0 * cosisq));

        double xno2 = nm * nm;
        double ainv2 = aonv * aonv;
        double temp1 = 3.0 * xno2 * ainv2;
        double temp = temp1 * root22;
        ds.d2201 = temp * f220 * g201;
        ds.d2211 = temp * f221 * g211;
        temp1 = temp1 * aonv;
        temp = temp1 * root32;
        ds.d3210 = temp * f321 * g310;
        ds.d3222 = temp * f322 * g322;
        temp1 = temp1 * aonv;
        temp = 2.0 * temp1 * root44;
        ds.d4410 = temp * f441 * g410;
        ds.d4422 = temp * f442 * g422;
        temp1 = temp1 * aonv;
        temp = temp1 * root52;
        ds.d5220 = temp * f522 * g520;
        ds.d5232 = temp * f523 * g532;
        temp = 2.0 * temp1 * root54;
        ds.d5421 = temp * f542 * g521;
        ds.d5433 = temp * f543 * g533;
        ds.xlamo = std::fmod(c.mo + c.nodeo + c.nodeo - theta - theta, TWO_PI);
        ds.xfact = c.mdot + ds.dmdt + 2.0 * (c.nodedot + ds.dnodt - RPTIM) - c.no_unkozai;
    } else {
        // Synchronous resonance
        double g200 = 1.0 + emsq * (-2.5 + 0.8125 * emsq);
        double g310 = 1.0 + 2.0 * emsq;
        double g300 = 1.0 + emsq * (-6.0 + 6.60937 * emsq);
        double f220 = 0.75 * (1.0 + cosim) * (1.0 + cosim);
        double f311 = 0.9375 * sinim * sinim * (1.0 + 3.0 * cosim) - 0.75 * (1.0 + cosim);
        double f330 = 1.0 + cosim;
        f330 = 1.875 * f330 * f330 * f330;
        double del1 = 3.0 * nm * nm * aonv * aonv;
        ds.del2 = 2.0 * del1 * f220 * g200 * q22;
        ds.del3 = 3.0 * del1 * f330 * g300 * q33 * aonv;
        ds.del1 = del1 * f311 * g310 * q31 * aonv;
        ds.xlamo = std::fmod(c.mo + c.nodeo + c.argpo - theta, TWO_PI);
        ds.xfact = c.mdot + xpidot - RPTIM + ds.dmdt + ds.domdt + ds.dnodt - c.no_unkozai;
    }
}

/**
 * Lunar-solar secular drift and resonance integration (Vallado's dspace).
 * The integrator always restarts from epoch, so results do not depend on
 * earlier calls.
 */
void deepSpaceSecular(const Coefficients& c, double t, double& em, double& argpm,
                      double& inclm, double& mm, double& nodem, double& nm) {
    constexpr double fasx2 = 0.13130908;
    constexpr double fasx4 = 2.8843198;
    constexpr double fasx6 = 0.37448087;
    constexpr double g22 = 5.7686396;
    constexpr double g32 = 0.95240898;
    constexpr double g44 = 1.8014998;
    constexpr double g52 = 1.0508330;
    constexpr double g54 = 4.4108898;
    constexpr double stepp = 720.0;
    constexpr double stepn = -720.0;
    constexpr double step2 = 259200.0;

    const DeepSpace& ds = c.deep;
    double theta = std::fmod(c.gsto + t * RPTIM, TWO_PI);
    em = em + ds.dedt * t;
    inclm = inclm + ds.didt * t;
    argpm = argpm + ds.domdt * t;
    nodem = nodem + ds.dnodt * t;
    mm = mm + ds.dmdt * t;

    if (ds.irez == 0) {
        return;
    }

    // Euler-Maclaurin integration in 720 minute steps
    double atime = 0.0;
    double xni = c.no_unkozai;
    double xli = ds.xlamo;
    double delt = t > 0.0 ? stepp : stepn;
    double xndt = 0.0, xldot = 0.0, xnddt = 0.0;
    double ft = 0.0;

    while (true) {
        if (ds.irez != 2) {
            xndt = ds.del1 * std::sin(xli - fasx2) + ds.del2 * std::sin(2.0 * (xli - fasx4))
                 + ds.del3 * std::sin(3.0 * (xli - fasx6));
            xldot = xni + ds.xfact;
            xnddt = ds.del1 * std::cos(xli - fasx2) + 2.0 * ds.del2 * std::cos(2.0 * (xli - fasx4))
                  + 3.0 * ds.del3 * std::cos(3.0 * (xli - fasx6));
            xnddt = xnddt * xldot;
        } else {
            double xomi = c.argpo + c.argpdot * atime;
            double x2omi = xomi + xomi;
            double x2li = xli + xli;
            xndt = ds.d2201 * std::sin(x2omi + xli - g22) + ds.d2211 * std::sin(xli - g22)
                 + ds.d3210 * std::sin(xomi + xli - g32) + ds.d3222 * std::sin(-xomi + xli - g32)
                 + ds.d4410 * std::sin(x2omi + x2li - g44) + ds.d4422 * std::sin(x2li - g44)
                 + ds.d5220 * std::sin(xomi + xli - g52) + ds.d5232 * std::sin(-xomi + xli - g52)
                 + ds.d5421 * std::sin(xomi + x2li - g54) + ds.d5433 * std::sin(-xomi + x2li - g54);
            xldot = xni + ds.xfact;
            xnddt = ds.d2201 * std::cos(x2omi + xli - g22) + ds.d2211 * std::cos(xli - g22)
                  + ds.d3210 * std::cos(xomi + xli - g32) + ds.d3222 * std::cos(-xomi + xli - g32)
                  + ds.d5220 * std::cos(xomi + xli - g52) + ds.d5232 * std::cos(-xomi + xli - g52)
                  + 2.0 * (ds.d4410 * std::cos(x2omi + x2li - g44) + ds.d4422 * std::cos(x2li - g44)
                  + ds.d5421 * std::cos(xomi + x2li - g54) + ds.d5433 * std::cos(-xomi + x2li - g54));
            xnddt = xnddt * xldot;
        }

        if (std::abs(t - atime) < stepp) {
            ft = t - atime;
            break;
        }
        xli = xli + xldot * delt + xndt * step2;
        xni = xni + xndt * delt + xnddt * step2;
        atime = atime + delt;
    }

    nm = xni + xndt * ft + xnddt * ft * ft * 0.5;
    double xl = xli + xldot * ft + xndt * ft * ft * 0.5;
    if (ds.irez != 1) {
        mm = xl - 2.0 * nodem + 2.0 * theta;
    } else {
        mm = xl - nodem - argpm + theta;
    }
}

/**
 * Lunar-solar periodics (Vallado's dpper). Uses the Lyddane form below
 * 0.2 rad inclination.
 */
void deepSpacePeriodic(const DeepSpace& ds, double t, double& ep, double& inclp,
                       double& nodep, double& argpp, double& mp) {
    double zm = ds.zmos + ZNS * t;
    double zf = zm + 2.0 * ZES * std::sin(zm);
    double sinzf = std::sin(zf);
    double f2 = 0.5 * sinzf * sinzf - 0.25;
    double f3 = -0.5 * sinzf * std::cos(zf);
    double ses = ds.se2 * f2 + ds.se3 * f3;
    double sis = ds.si2 * f2 + ds.si3 * f3;
    double sls = ds.sl2 * f2 + ds.sl3 * f3 + ds.sl4 * sinzf;
    double sghs = ds.sgh2 * f2 + ds.sgh3 * f3 + ds.sgh4 * sinzf;
    double shs = ds.sh2 * f2 + ds.sh3 * f3;

    zm = ds.zmol + ZNL * t;
    zf = zm + 2.0 * ZEL * std::sin(zm);
    sinzf = std::sin(zf);
    f2 = 0.5 * sinzf * sinzf - 0.25;
    f3 = -0.5 * sinzf * std::cos(zf);
    double sel = ds.ee2 * f2 + ds.e3 * f3;
    double sil = ds.xi2 * f2 + ds.xi3 * f3;
    double sll = ds.xl2 * f2 + ds.xl3 * f3 + ds.xl4 * sinzf;
    double sghl = ds.xgh2 * f2 + ds.xgh3 * f3 + ds.xgh4 * sinzf;
    double shll = ds.xh2 * f2 + ds.xh3 * f3;

    double pe = ses + sel;
    double pinc = sis + sil;
    double pl = sls + sll;
    double pgh = sghs + sghl;
    double ph = shs + shll;

    inclp = inclp + pinc;
    ep = ep + pe;
    double sinip = std::sin(inclp);
    double cosip = std::cos(inclp);

    if (inclp >= 0.2) {
        ph = ph / sinip;
        pgh = pgh - cosip * ph;
        argpp = argpp + pgh;
        nodep = nodep + ph;
        mp = mp + pl;
        return;
    }

    double sinop = std::sin(nodep);
    double cosop = std::cos(nodep);
    double alfdp = sinip * sinop;
    double betdp = sinip * cosop;
    double dalf = ph * cosop + pinc * cosip * sinop;
    double dbet = -ph * sinop + pinc * cosip * cosop;
    alfdp = alfdp + dalf;
    betdp = betdp + dbet;
    nodep = std::fmod(nodep, TWO_PI);
    double xls = mp + argpp + cosip * nodep;
    double dls = pl + pgh - pinc * nodep * sinip;
    xls = xls + dls;
    double xnoh = nodep;
    nodep = std::atan2(alfdp, betdp);
    if (std::abs(xnoh - nodep) > PI) {
        nodep = nodep < xnoh ? nodep + TWO_PI : nodep - TWO_PI;
    }
    mp = mp + pl;
    argpp = xls - mp - cosip * nodep;
}

} // namespace

double gstime(double jdut1) {
    double tut1 = (jdut1 - 2451545.0) / 36525.0;
    double temp = -6.2e-6 * tut1 * tut1 * tut1 + 0.093104 * tut1 * tut1
                + (876600.0 * 3600.0 + 8640184.812866) * tut1 + 67310.54841;
    // Seconds of time to radians
    temp = std::fmod(temp * (PI / 180.0) / 240.0, TWO_PI);
    if (temp < 0.0) {
        temp += TWO_PI;
    }
    return temp;
}

Coefficients initialize(const Elements& elements) {
    constexpr double radiusearthkm = RADIUS_EARTH_KM;
    constexpr double xke = XKE;
    constexpr double j2 = J2;
    constexpr double j3oj2 = J3OJ2;
    constexpr double j4 = J4;

    if (!(elements.mean_motion > 0.0)) {
        throw InvalidOrbitException("Mean motion must be positive: " + std::to_string(elements.mean_motion));
    }
    if (!(elements.eccentricity >= 0.0 && elements.eccentricity < 1.0)) {
        throw InvalidOrbitException("Eccentricity out of range: " + std::to_string(elements.eccentricity));
    }

    Coefficients c;
    c.ecco = elements.eccentricity;
    c.inclo = elements.inclination;
    c.nodeo = elements.raan;
    c.argpo = elements.arg_perigee;
    c.mo = elements.mean_anomaly;
    c.bstar = elements.bstar;
    c.gsto = gstime(elements.epoch_jd);

    // Recover the original (un-Kozai'd) mean motion and semi-major axis
    double no_kozai = elements.mean_motion;
    double a1 = std::pow(xke / no_kozai, X2O3);
    double cosio = std::cos(c.inclo);
    double sinio = std::sin(c.inclo);
    double cosio2 = cosio * cosio;
    double eccsq = c.ecco * c.ecco;
    double omeosq = 1.0 - eccsq;
    double rteosq = std::sqrt(omeosq);
    double d1 = 0.75 * j2 * (3.0 * cosio2 - 1.0) / (rteosq * omeosq);
    double del_ = d1 / (a1 * a1);
    double adel = a1 * (1.0 - del_ * (1.0/3.0 + del_ * (1.0 + 134.0/81.0 * del_)));
    double delo = d1 / (adel * adel);
    c.no_unkozai = no_kozai / (1.0 + delo);

    double ao = std::pow(xke / c.no_unkozai, X2O3);

    // Perigee radius in Earth radii
    double rp = ao * (1.0 - c.ecco);
    if (rp < 1.0) {
        throw SatelliteDecayedException("Perigee is below the Earth's surface ("
            + std::to_string((rp - 1.0) * radiusearthkm) + " km)");
    }

    double ss = 78.0 / radiusearthkm + 1.0;
    double qzms2t = std::pow((120.0 - 78.0) / radiusearthkm, 4);

    c.isimp = rp < (220.0 / radiusearthkm + 1.0);

    double sfour = ss;
    double qzms24 = qzms2t;
    double perige = (rp - 1.0) * radiusearthkm;

    // For perigees below 156 km, adjust s and qoms2t
    if (perige < 156.0) {
        sfour = perige - 78.0;
        if (perige < 98.0) {
            sfour = 20.0;
        }
        qzms24 = std::pow((120.0 - sfour) / radiusearthkm, 4);
        sfour = sfour / radiusearthkm + 1.0;
    }

    double po = ao * omeosq;
    double pinvsq = 1.0 / (po * po);
    double tsi = 1.0 / (ao - sfour);
    c.eta = ao * c.ecco * tsi;
    double etasq = c.eta * c.eta;
    double eeta = c.ecco * c.eta;
    double psisq = std::abs(1.0 - etasq);
    double coef = qzms24 * std::pow(tsi, 4);
    double coef1 = coef / std::pow(psisq, 3.5);

    c.con41 = 3.0 * cosio2 - 1.0;
    c.x1mth2 = 1.0 - cosio2;
    c.x7thm1 = 7.0 * cosio2 - 1.0;

    double cc2 = coef1 * c.no_unkozai * (ao * (1.0 + 1.5 * etasq + eeta * (4.0 + etasq))
                 + 0.375 * j2 * tsi / psisq * c.con41 * (8.0 + 3.0 * etasq * (8.0 + etasq)));
    c.cc1 = c.bstar * cc2;
    double cc3 = 0.0;
    if (c.ecco > 1.0e-4) {
        cc3 = -2.0 * coef * tsi * j3oj2 * c.no_unkozai * sinio / c.ecco;
    }
    c.cc4 = 2.0 * c.no_unkozai * coef1 * ao * omeosq
          * (c.eta * (2.0 + 0.5 * etasq) + c.ecco * (0.5 + 2.0 * etasq)
          - j2 * tsi / (ao * psisq)
          * (-3.0 * c.con41 * (1.0 - 2.0 * eeta + etasq * (1.5 - 0.5 * eeta))
          + 0.75 * c.x1mth2 * (2.0 * etasq - eeta * (1.0 + etasq)) * std::cos(2.0 * c.argpo)));
    c.cc5 = 2.0 * coef1 * ao * omeosq * (1.0 + 2.75 * (etasq + eeta) + eeta * etasq);

    // Secular rates from J2 and J4
    double cosio4 = cosio2 * cosio2;
    double temp1 = 1.5 * j2 * pinvsq * c.no_unkozai;
    double temp2 = 0.5 * temp1 * j2 * pinvsq;
    double temp3 = -0.46875 * j4 * pinvsq * pinvsq * c.no_unkozai;
    c.mdot = c.no_unkozai + 0.5 * temp1 * rteosq * c.con41
           + 0.0625 * temp2 * rteosq * (13.0 - 78.0 * cosio2 + 137.0 * cosio4);
    c.argpdot = -0.5 * temp1 * (1.0 - 5.0 * cosio2)
              + 0.0625 * temp2 * (7.0 - 114.0 * cosio2 + 395.0 * cosio4)
              + temp3 * (3.0 - 36.0 * cosio2 + 49.0 * cosio4);
    double xhdot1 = -temp1 * cosio;
    c.nodedot = xhdot1 + (0.5 * temp2 * (4.0 - 19.0 * cosio2) + 2.0 * temp3 * (3.0 - 7.0 * cosio2)) * cosio;
    c.omgcof = c.bstar * cc3 * std::cos(c.argpo);
    if (c.ecco > 1.0e-4) {
        c.xmcof = -X2O3 * coef * c.bstar / eeta;
    }
    c.nodecf = 3.5 * omeosq * xhdot1 * c.cc1;
    c.t2cof = 1.5 * c.cc1;

    // Guard the division for retrograde equatorial orbits
    double denominator = std::abs(cosio + 1.0) > 1.5e-12 ? (1.0 + cosio) : 1.5e-12;
    c.xlcof = -0.25 * j3oj2 * sinio * (3.0 + 5.0 * cosio) / denominator;
    c.aycof = -0.5 * j3oj2 * sinio;

    c.delmo = std::pow(1.0 + c.eta * std::cos(c.mo), 3);
    c.sinmao = std::sin(c.mo);

    if (TWO_PI / c.no_unkozai >= DEEP_SPACE_PERIOD_MINUTES) {
        c.deepSpace = true;
        c.isimp = true;
        auto terms = thirdBodyTerms(elements.epoch_jd - JD_1950, c.ecco, c.argpo, c.inclo,
                                    c.nodeo, c.no_unkozai, c.deep);
        initializeDeepSpace(c, terms, c.argpdot + c.nodedot);
    }

    if (!c.isimp) {
        double c1sq = c.cc1 * c.cc1;
        c.d2 = 4.0 * ao * tsi * c1sq;
        double temp = c.d2 * tsi * c.cc1 / 3.0;
        c.d3 = (17.0 * ao + sfour) * temp;
        c.d4 = 0.5 * temp * ao * tsi * (221.0 * ao + 31.0 * sfour) * c.cc1;
        c.t3cof = c.d2 + 2.0 * c1sq;
        c.t4cof = 0.25 * (3.0 * c.d3 + c.cc1 * (12.0 * c.d2 + 10.0 * c1sq));
        c.t5cof = 0.2 * (3.0 * c.d4 + 12.0 * c.cc1 * c.d3 + 6.0 * c.d2 * c.d2 + 15.0 * c1sq * (2.0 * c.d2 + c1sq));
    }

    return c;
}

Result propagate(const Coefficients& c, double tsince) {
    constexpr double radiusearthkm = RADIUS_EARTH_KM;
    constexpr double xke = XKE;
    constexpr double j2 = J2;
    constexpr double vkmpersec = VKMPERSEC;

    // Secular gravity and atmospheric drag
    double xmdf = c.mo + c.mdot * tsince;
    double argpdf = c.argpo + c.argpdot * tsince;
    double nodedf = c.nodeo + c.nodedot * tsince;
    double argpm = argpdf;
    double mm = xmdf;
    double t2 = tsince * tsince;
    double nodem = nodedf + c.nodecf * t2;
    double tempa = 1.0 - c.cc1 * tsince;
    double tempe = c.bstar * c.cc4 * tsince;
    double templ = c.t2cof * t2;

    if (!c.isimp) {
        double delomg = c.omgcof * tsince;
        double delm = c.xmcof * (std::pow(1.0 + c.eta * std::cos(xmdf), 3) - c.delmo);
        double temp = delomg + delm;
        mm = xmdf + temp;
        argpm = argpdf - temp;
        double t3 = t2 * tsince;
        double t4 = t3 * tsince;
        tempa = tempa - c.d2 * t2 - c.d3 * t3 - c.d4 * t4;
        tempe = tempe + c.bstar * c.cc5 * (std::sin(mm) - c.sinmao);
        templ = templ + c.t3cof * t3 + t4 * (c.t4cof + tsince * c.t5cof);
    }

    double nm = c.no_unkozai;
    double em = c.ecco;
    double inclm = c.inclo;
    if (c.deepSpace) {
        deepSpaceSecular(c, tsince, em, argpm, inclm, mm, nodem, nm);
    }
    if (!(nm > 0.0)) {
        throw InvalidOrbitException("Mean motion is not positive during propagation");
    }

    double am = std::pow(xke / nm, X2O3) * tempa * tempa;
    nm = xke / std::pow(am, 1.5);
    em = em - tempe;

    if (!(nm > 0.0) || am < 0.95) {
        throw SatelliteDecayedException("Mean semi-major axis decayed below the Earth's surface");
    }
    if (em >= 1.0 || em < -0.001) {
        throw InvalidOrbitException("Eccentricity out of range during propagation: " + std::to_string(em));
    }
    if (em < 1.0e-6) {
        em = 1.0e-6;
    }

    mm = mm + c.no_unkozai * templ;
    double xlm = mm + argpm + nodem;

    nodem = std::fmod(nodem, TWO_PI);
    argpm = std::fmod(argpm, TWO_PI);
    xlm = std::fmod(xlm, TWO_PI);
    mm = std::fmod(xlm - argpm - nodem, TWO_PI);

    double ep = em;
    double xincp = inclm;
    double argpp = argpm;
    double nodep = nodem;
    double mp = mm;
    double aycof = c.aycof;
    double xlcof = c.xlcof;

    if (c.deepSpace) {
        deepSpacePeriodic(c.deep, tsince, ep, xincp, nodep, argpp, mp);
        if (xincp < 0.0) {
            xincp = -xincp;
            nodep = nodep + PI;
            argpp = argpp - PI;
        }
        if (ep < 0.0 || ep > 1.0) {
            throw InvalidOrbitException("Eccentricity out of range after lunar-solar terms: " + std::to_string(ep));
        }

        double sinip = std::sin(xincp);
        double cosip = std::cos(xincp);
        double denominator = std::abs(cosip + 1.0) > 1.5e-12 ? (1.0 + cosip) : 1.5e-12;
        aycof = -0.5 * J3OJ2 * sinip;
        xlcof = -0.25 * J3OJ2 * sinip * (3.0 + 5.0 * cosip) / denominator;
    }

    double cosio = std::cos(xincp);
    double sinio = std::sin(xincp);

    // Long period periodics
    double axnl = ep * std::cos(argpp);
    double temp = 1.0 / (am * (1.0 - ep * ep));
    double aynl = ep * std::sin(argpp) + temp * aycof;
    double xl = mp + argpp + nodep + temp * xlcof * axnl;

    // Solve Kepler's equation
    double u = std::fmod(xl - nodep, TWO_PI);
    double eo1 = u;
    double tem5 = 9999.9;
    int ktr = 1;
    double sineo1 = 0.0, coseo1 = 0.0;

    while ((std::abs(tem5) >= 1.0e-12) && (ktr <= 10)) {
        sineo1 = std::sin(eo1);
        coseo1 = std::cos(eo1);
        tem5 = 1.0 - coseo1 * axnl - sineo1 * aynl;
        tem5 = (u - aynl * coseo1 + axnl * sineo1 - eo1) / tem5;
        if (std::abs(tem5) >= 0.95) {
            tem5 = tem5 > 0.0 ? 0.95 : -0.95;
        }
        eo1 = eo1 + tem5;
        ktr++;
    }

    // Short period preliminary quantities
    double ecose = axnl * coseo1 + aynl * sineo1;
    double esine = axnl * sineo1 - aynl * coseo1;
    double el2 = axnl * axnl + aynl * aynl;
    double pl = am * (1.0 - el2);

    if (pl < 0.0) {
        throw InvalidOrbitException("Semi-latus rectum is negative");
    }

    double rl = am * (1.0 - ecose);
    double rdotl = std::sqrt(am) * esine / rl;
    double rvdotl = std::sqrt(pl) / rl;
    double betal = std::sqrt(1.0 - el2);
    temp = esine / (1.0 + betal);
    double sinu = am / rl * (sineo1 - aynl - axnl * temp);
    double cosu = am / rl * (coseo1 - axnl + aynl * temp);
    double su = std::atan2(sinu, cosu);
    double sin2u = (cosu + cosu) * sinu;
    double cos2u = 1.0 - 2.0 * sinu * sinu;
    temp = 1.0 / pl;
    double temp1 = 0.5 * j2 * temp;
    double temp2 = temp1 * temp;

    // Inclination terms move with the lunar-solar periodics in deep space
    double con41 = c.con41;
    double x1mth2 = c.x1mth2;
    double x7thm1 = c.x7thm1;
    if (c.deepSpace) {
        double cosisq = cosio * cosio;
        con41 = 3.0 * cosisq - 1.0;
        x1mth2 = 1.0 - cosisq;
        x7thm1 = 7.0 * cosisq - 1.0;
    }

    // Short period periodics
    double mrt = rl * (1.0 - 1.5 * temp2 * betal * con41) + 0.5 * temp1 * x1mth2 * cos2u;
    su = su - 0.25 * temp2 * x7thm1 * sin2u;
    double xnode = nodep + 1.5 * temp2 * cosio * sin2u;
    double xinc = xincp + 1.5 * temp2 * cosio * sinio * cos2u;
    double mvt = rdotl - nm * temp1 * x1mth2 * sin2u / xke;
    double rvdot = rvdotl + nm * temp1 * (x1mth2 * cos2u + 1.5 * con41) / xke;

    if (mrt < 1.0) {
        throw SatelliteDecayedException();
    }

    // Orientation vectors
    double sinsu = std::sin(su);
    double cossu = std::cos(su);
    double snod = std::sin(xnode);
    double cnod = std::cos(xnode);
    double sini = std::sin(xinc);
    double cosi = std::cos(xinc);
    double xmx = -snod * cosi;
    double xmy = cnod * cosi;
    double ux = xmx * sinsu + cnod * cossu;
    double uy = xmy * sinsu + snod * cossu;
    double uz = sini * sinsu;
    double vx = xmx * cossu - cnod * sinsu;
    double vy = xmy * cossu - snod * sinsu;
    double vz = sini * cossu;

    Result result;
    result.r[0] = mrt * ux * radiusearthkm;
    result.r[1] = mrt * uy * radiusearthkm;
    result.r[2] = mrt * uz * radiusearthkm;
    result.v[0] = (mvt * ux + rvdot * vx) * vkmpersec;
    result.v[1] = (mvt * uy + rvdot * vy) * vkmpersec;
    result.v[2] = (mvt * uz + rvdot * vz) * vkmpersec;
    return result;
}

} // namespace skypass::sgp4
