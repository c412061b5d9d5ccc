/// @file solar_system_catalog.cpp
/// @brief Solar System record data.

#include "catalog/solar_system_catalog.hpp"

namespace orrery::catalog
{

namespace
{
    BodyRecord build_solar_system()
    {
        return BodyRecord{
            .name = "Sun",
            .mass_kg = 1.989e30,
            .radius_km = 696340,
            .orbit_radius_km = 0,
            .orbital_period_days = 0,
            .eccentricity = 0.0,
            .color = {255, 255, 190},
            .facts = {
                {"Radius", "696340 km"},
                {"Composition", "Hydrogen (73.5%), Helium (24%) plasma"},
                {"Discovery", "Prehistoric"},
                {"Missions", "Parker Solar Probe (2018-present)"},
                {"Trivia", "Contains 99.86% of Solar System's mass"},
            },
            .children = {
                {
                    .name = "Mercury",
                    .mass_kg = 3.301e23,
                    .radius_km = 2439.7,
                    .orbit_radius_km = 57.91e6,
                    .orbital_period_days = 87.97,
                    .eccentricity = 0.2056,
                    .color = {170, 170, 170},
                    .facts = {
                        {"Radius", "2439.7 km"},
                        {"Composition", "Rock (silicates, iron core)"},
                        {"Discovery", "Prehistoric"},
                        {"Missions", "Mariner 10 (1974-75), MESSENGER (2011-15)"},
                        {"Trivia", "Highest orbital eccentricity of planets"},
                    },
                },
                {
                    .name = "Venus",
                    .mass_kg = 4.867e24,
                    .radius_km = 6051.8,
                    .orbit_radius_km = 108.21e6,
                    .orbital_period_days = 224.70,
                    .eccentricity = 0.0067,
                    .color = {230, 230, 230},
                    .facts = {
                        {"Radius", "6051.8 km"},
                        {"Composition", "Rock (silicates, carbon dioxide atmosphere)"},
                        {"Discovery", "Prehistoric"},
                        {"Missions", "Venera (1961-84), Magellan (1990-94)"},
                        {"Trivia", "Hottest planet due to greenhouse effect"},
                    },
                },
                {
                    .name = "Earth",
                    .mass_kg = 5.972e24,
                    .radius_km = 6371,
                    .orbit_radius_km = 149.60e6,
                    .orbital_period_days = 365.26,
                    .eccentricity = 0.0167,
                    .color = {50, 100, 200},
                    .facts = {
                        {"Radius", "6371 km"},
                        {"Composition", "Rock (silicates, iron core), water"},
                        {"Discovery", "Prehistoric"},
                        {"Missions", "Apollo, ISS (1998-present)"},
                        {"Trivia", "Only known planet with life"},
                    },
                },
                {
                    .name = "Mars",
                    .mass_kg = 6.417e23,
                    .radius_km = 3389.5,
                    .orbit_radius_km = 227.94e6,
                    .orbital_period_days = 686.98,
                    .eccentricity = 0.0934,
                    .color = {200, 100, 50},
                    .facts = {
                        {"Radius", "3389.5 km"},
                        {"Composition", "Rock (silicates, iron oxide)"},
                        {"Discovery", "Prehistoric"},
                        {"Missions", "Viking (1976), Perseverance (2021-present)"},
                        {"Trivia", "Has the largest volcano (Olympus Mons)"},
                    },
                    .children = {
                        {
                            .name = "Phobos",
                            .mass_kg = 1.066e16,
                            .radius_km = 11.1,
                            .orbit_radius_km = 9377,
                            .orbital_period_days = 0.319,
                            .eccentricity = 0.0151,
                            .facts = {
                                {"Radius", "11.1 km"},
                                {"Composition", "Rock, regolith"},
                                {"Discovery", "1877 (Asaph Hall)"},
                                {"Missions", "Mars rovers (imagery)"},
                                {"Trivia", "Will crash into Mars in ~50M years"},
                            },
                        },
                        {
                            .name = "Deimos",
                            .mass_kg = 1.471e15,
                            .radius_km = 6.2,
                            .orbit_radius_km = 23460,
                            .orbital_period_days = 1.263,
                            .eccentricity = 0.0002,
                            .facts = {
                                {"Radius", "6.2 km"},
                                {"Composition", "Rock, regolith"},
                                {"Discovery", "1877 (Asaph Hall)"},
                                {"Missions", "Mars rovers (imagery)"},
                                {"Trivia", "Smallest moon of Mars"},
                            },
                        },
                    },
                },
                {
                    .name = "Jupiter",
                    .mass_kg = 1.898e27,
                    .radius_km = 69911,
                    .orbit_radius_km = 778.57e6,
                    .orbital_period_days = 4332.59,
                    .eccentricity = 0.0489,
                    .color = {220, 180, 130},
                    .facts = {
                        {"Radius", "69911 km"},
                        {"Composition", "Gas (hydrogen, helium)"},
                        {"Discovery", "Prehistoric"},
                        {"Missions", "Voyager, Juno (2016-present)"},
                        {"Trivia", "Largest planet, Great Red Spot"},
                    },
                    .children = {
                        {
                            .name = "Io",
                            .mass_kg = 8.932e22,
                            .radius_km = 1821.6,
                            .orbit_radius_km = 421800,
                            .orbital_period_days = 1.769,
                            .eccentricity = 0.0041,
                            .facts = {
                                {"Radius", "1821.6 km"},
                                {"Composition", "Rock, sulfur"},
                                {"Discovery", "1610 (Galileo)"},
                                {"Missions", "Voyager, Galileo"},
                                {"Trivia", "Most volcanically active body"},
                            },
                        },
                        {
                            .name = "Europa",
                            .mass_kg = 4.800e22,
                            .radius_km = 1560.8,
                            .orbit_radius_km = 671100,
                            .orbital_period_days = 3.551,
                            .eccentricity = 0.0094,
                            .facts = {
                                {"Radius", "1560.8 km"},
                                {"Composition", "Ice, rock"},
                                {"Discovery", "1610 (Galileo)"},
                                {"Missions", "Voyager, Galileo, Europa Clipper (2024)"},
                                {"Trivia", "Possible subsurface ocean"},
                            },
                        },
                        {
                            .name = "Ganymede",
                            .mass_kg = 1.482e23,
                            .radius_km = 2631.2,
                            .orbit_radius_km = 1070400,
                            .orbital_period_days = 7.155,
                            .eccentricity = 0.0013,
                            .facts = {
                                {"Radius", "2631.2 km"},
                                {"Composition", "Ice, rock"},
                                {"Discovery", "1610 (Galileo)"},
                                {"Missions", "Voyager, Galileo"},
                                {"Trivia", "Largest moon in Solar System"},
                            },
                        },
                        {
                            .name = "Callisto",
                            .mass_kg = 1.076e23,
                            .radius_km = 2410.3,
                            .orbit_radius_km = 1882700,
                            .orbital_period_days = 16.689,
                            .eccentricity = 0.0074,
                            .facts = {
                                {"Radius", "2410.3 km"},
                                {"Composition", "Ice, rock"},
                                {"Discovery", "1610 (Galileo)"},
                                {"Missions", "Voyager, Galileo"},
                                {"Trivia", "Most heavily cratered moon"},
                            },
                        },
                    },
                },
                {
                    .name = "Saturn",
                    .mass_kg = 5.683e26,
                    .radius_km = 58232,
                    .orbit_radius_km = 1433.53e6,
                    .orbital_period_days = 10759.22,
                    .eccentricity = 0.0565,
                    .color = {220, 190, 150},
                    .facts = {
                        {"Radius", "58232 km"},
                        {"Composition", "Gas (hydrogen, helium)"},
                        {"Discovery", "Prehistoric"},
                        {"Missions", "Cassini (2004-2017)"},
                        {"Trivia", "Famous for prominent rings"},
                    },
                    .children = {
                        {
                            .name = "Mimas",
                            .mass_kg = 3.751e19,
                            .radius_km = 198.2,
                            .orbit_radius_km = 185540,
                            .orbital_period_days = 0.942,
                            .eccentricity = 0.0196,
                            .facts = {
                                {"Radius", "198.2 km"},
                                {"Composition", "Ice"},
                                {"Discovery", "1789 (William Herschel)"},
                                {"Missions", "Cassini"},
                                {"Trivia", "Herschel Crater resembles Death Star"},
                            },
                        },
                        {
                            .name = "Enceladus",
                            .mass_kg = 1.080e20,
                            .radius_km = 252.1,
                            .orbit_radius_km = 238040,
                            .orbital_period_days = 1.370,
                            .eccentricity = 0.0047,
                            .facts = {
                                {"Radius", "252.1 km"},
                                {"Composition", "Ice, possible subsurface ocean"},
                                {"Discovery", "1789 (William Herschel)"},
                                {"Missions", "Cassini"},
                                {"Trivia", "Geysers eject water vapor"},
                            },
                        },
                        {
                            .name = "Tethys",
                            .mass_kg = 6.174e20,
                            .radius_km = 531.1,
                            .orbit_radius_km = 294670,
                            .orbital_period_days = 1.888,
                            .eccentricity = 0.0001,
                            .facts = {
                                {"Radius", "531.1 km"},
                                {"Composition", "Ice"},
                                {"Discovery", "1684 (Cassini)"},
                                {"Missions", "Cassini"},
                                {"Trivia", "Features Ithaca Chasma"},
                            },
                        },
                        {
                            .name = "Dione",
                            .mass_kg = 1.095e21,
                            .radius_km = 561.7,
                            .orbit_radius_km = 377420,
                            .orbital_period_days = 2.737,
                            .eccentricity = 0.0022,
                            .facts = {
                                {"Radius", "561.7 km"},
                                {"Composition", "Ice, rock"},
                                {"Discovery", "1684 (Cassini)"},
                                {"Missions", "Cassini"},
                                {"Trivia", "Wispy terrain on trailing hemisphere"},
                            },
                        },
                        {
                            .name = "Rhea",
                            .mass_kg = 2.307e21,
                            .radius_km = 763.8,
                            .orbit_radius_km = 527070,
                            .orbital_period_days = 4.518,
                            .eccentricity = 0.001,
                            .facts = {
                                {"Radius", "763.8 km"},
                                {"Composition", "Ice, rock"},
                                {"Discovery", "1672 (Cassini)"},
                                {"Missions", "Cassini"},
                                {"Trivia", "Second-largest Saturnian moon"},
                            },
                        },
                        {
                            .name = "Titan",
                            .mass_kg = 1.345e23,
                            .radius_km = 2574.7,
                            .orbit_radius_km = 1221870,
                            .orbital_period_days = 15.945,
                            .eccentricity = 0.0288,
                            .facts = {
                                {"Radius", "2574.7 km"},
                                {"Composition", "Ice, rock, methane atmosphere"},
                                {"Discovery", "1655 (Christiaan Huygens)"},
                                {"Missions", "Cassini-Huygens"},
                                {"Trivia", "Only moon with stable lakes"},
                            },
                        },
                        {
                            .name = "Iapetus",
                            .mass_kg = 1.806e21,
                            .radius_km = 734.5,
                            .orbit_radius_km = 3560840,
                            .orbital_period_days = 79.330,
                            .eccentricity = 0.0283,
                            .facts = {
                                {"Radius", "734.5 km"},
                                {"Composition", "Ice, rock"},
                                {"Discovery", "1671 (Cassini)"},
                                {"Missions", "Cassini"},
                                {"Trivia", "Two-toned coloration"},
                            },
                        },
                    },
                },
                {
                    .name = "Uranus",
                    .mass_kg = 8.681e25,
                    .radius_km = 25362,
                    .orbit_radius_km = 2872.46e6,
                    .orbital_period_days = 30589.00,
                    .eccentricity = 0.0457,
                    .color = {180, 210, 230},
                    .facts = {
                        {"Radius", "25362 km"},
                        {"Composition", "Gas (hydrogen, helium, methane)"},
                        {"Discovery", "1781 (William Herschel)"},
                        {"Missions", "Voyager 2 (1986)"},
                        {"Trivia", "Axis tilted 98 degrees"},
                    },
                    .children = {
                        {
                            .name = "Miranda",
                            .mass_kg = 6.590e19,
                            .radius_km = 235.8,
                            .orbit_radius_km = 129900,
                            .orbital_period_days = 1.413,
                            .eccentricity = 0.0013,
                            .facts = {
                                {"Radius", "235.8 km"},
                                {"Composition", "Ice, rock"},
                                {"Discovery", "1948 (Gerard Kuiper)"},
                                {"Missions", "Voyager 2"},
                                {"Trivia", "Extreme geological features"},
                            },
                        },
                        {
                            .name = "Ariel",
                            .mass_kg = 1.353e21,
                            .radius_km = 578.9,
                            .orbit_radius_km = 190900,
                            .orbital_period_days = 2.520,
                            .eccentricity = 0.0012,
                            .facts = {
                                {"Radius", "578.9 km"},
                                {"Composition", "Ice, rock"},
                                {"Discovery", "1851 (William Lassell)"},
                                {"Missions", "Voyager 2"},
                                {"Trivia", "Brightest Uranian moon"},
                            },
                        },
                        {
                            .name = "Umbriel",
                            .mass_kg = 1.172e21,
                            .radius_km = 584.7,
                            .orbit_radius_km = 266000,
                            .orbital_period_days = 4.144,
                            .eccentricity = 0.0039,
                            .facts = {
                                {"Radius", "584.7 km"},
                                {"Composition", "Ice, rock"},
                                {"Discovery", "1851 (William Lassell)"},
                                {"Missions", "Voyager 2"},
                                {"Trivia", "Darkest Uranian moon"},
                            },
                        },
                        {
                            .name = "Titania",
                            .mass_kg = 3.527e21,
                            .radius_km = 788.9,
                            .orbit_radius_km = 436300,
                            .orbital_period_days = 8.706,
                            .eccentricity = 0.0011,
                            .facts = {
                                {"Radius", "788.9 km"},
                                {"Composition", "Ice, rock"},
                                {"Discovery", "1787 (William Herschel)"},
                                {"Missions", "Voyager 2"},
                                {"Trivia", "Largest Uranian moon"},
                            },
                        },
                        {
                            .name = "Oberon",
                            .mass_kg = 3.014e21,
                            .radius_km = 761.4,
                            .orbit_radius_km = 583500,
                            .orbital_period_days = 13.463,
                            .eccentricity = 0.0014,
                            .facts = {
                                {"Radius", "761.4 km"},
                                {"Composition", "Ice, rock"},
                                {"Discovery", "1787 (William Herschel)"},
                                {"Missions", "Voyager 2"},
                                {"Trivia", "Features large craters"},
                            },
                        },
                    },
                },
                {
                    .name = "Neptune",
                    .mass_kg = 1.024e26,
                    .radius_km = 24622,
                    .orbit_radius_km = 4495.06e6,
                    .orbital_period_days = 59800.00,
                    .eccentricity = 0.0113,
                    .color = {100, 150, 230},
                    .facts = {
                        {"Radius", "24622 km"},
                        {"Composition", "Gas (hydrogen, helium, methane)"},
                        {"Discovery", "1846 (Le Verrier, Galle)"},
                        {"Missions", "Voyager 2 (1989)"},
                        {"Trivia", "Strongest winds in Solar System"},
                    },
                    .children = {
                        {
                            .name = "Triton",
                            .mass_kg = 2.140e22,
                            .radius_km = 1353.4,
                            .orbit_radius_km = 354760,
                            .orbital_period_days = -5.877,
                            .eccentricity = 0.000016,
                            .facts = {
                                {"Radius", "1353.4 km"},
                                {"Composition", "Ice, rock, nitrogen frost"},
                                {"Discovery", "1846 (William Lassell)"},
                                {"Missions", "Voyager 2"},
                                {"Trivia", "Retrograde orbit, likely captured"},
                            },
                        },
                    },
                },
                {
                    .name = "Pluto",
                    .mass_kg = 1.309e22,
                    .radius_km = 1188,
                    .orbit_radius_km = 5906.38e6,
                    .orbital_period_days = 90560,
                    .eccentricity = 0.2488,
                    .color = {200, 100, 100},
                    .facts = {
                        {"Radius", "1188 km"},
                        {"Composition", "Ice (nitrogen, methane), rock"},
                        {"Discovery", "1930 (Clyde Tombaugh)"},
                        {"Missions", "New Horizons (2015)"},
                        {"Trivia", "Reclassified as dwarf planet (2006)"},
                    },
                    .children = {
                        {
                            .name = "Charon",
                            .mass_kg = 1.586e21,
                            .radius_km = 606,
                            .orbit_radius_km = 19640,
                            .orbital_period_days = 6.387,
                            .eccentricity = 0.0,
                            .facts = {
                                {"Radius", "606 km"},
                                {"Composition", "Ice, rock"},
                                {"Discovery", "1978 (James Christy)"},
                                {"Missions", "New Horizons (2015)"},
                                {"Trivia", "Forms binary system with Pluto"},
                            },
                        },
                        {
                            .name = "Nix",
                            .mass_kg = 4.5e16,
                            .radius_km = 23,
                            .orbit_radius_km = 48694,
                            .orbital_period_days = 24.854,
                            .eccentricity = 0.002,
                            .facts = {
                                {"Radius", "23 km"},
                                {"Composition", "Ice"},
                                {"Discovery", "2005 (Weaver, Stern)"},
                                {"Missions", "New Horizons"},
                                {"Trivia", "Small, irregular shape"},
                            },
                        },
                        {
                            .name = "Hydra",
                            .mass_kg = 4.8e16,
                            .radius_km = 30.5,
                            .orbit_radius_km = 64738,
                            .orbital_period_days = 38.202,
                            .eccentricity = 0.005,
                            .facts = {
                                {"Radius", "30.5 km"},
                                {"Composition", "Ice"},
                                {"Discovery", "2005 (Weaver, Stern)"},
                                {"Missions", "New Horizons"},
                                {"Trivia", "Elongated shape"},
                            },
                        },
                        {
                            .name = "Kerberos",
                            .mass_kg = 1.6e16,
                            .radius_km = 14,
                            .orbit_radius_km = 57783,
                            .orbital_period_days = 32.167,
                            .eccentricity = 0.003,
                            .facts = {
                                {"Radius", "14 km"},
                                {"Composition", "Ice"},
                                {"Discovery", "2011 (Showalter)"},
                                {"Missions", "New Horizons"},
                                {"Trivia", "Faint, small moon"},
                            },
                        },
                        {
                            .name = "Styx",
                            .mass_kg = 7.5e15,
                            .radius_km = 10,
                            .orbit_radius_km = 42656,
                            .orbital_period_days = 20.161,
                            .eccentricity = 0.006,
                            .facts = {
                                {"Radius", "10 km"},
                                {"Composition", "Ice"},
                                {"Discovery", "2012 (Showalter)"},
                                {"Missions", "New Horizons"},
                                {"Trivia", "Smallest Plutonian moon"},
                            },
                        },
                    },
                },
                {
                    .name = "Eris",
                    .mass_kg = 1.66e22,
                    .radius_km = 1163,
                    .orbit_radius_km = 10159.8e6,
                    .orbital_period_days = 203670,
                    .eccentricity = 0.436,
                    .color = {180, 180, 180},
                    .facts = {
                        {"Radius", "1163 km"},
                        {"Composition", "Ice, rock"},
                        {"Discovery", "2005 (Brown, Trujillo, Rabinowitz)"},
                        {"Missions", "None"},
                        {"Trivia", "More massive than Pluto"},
                    },
                    .children = {
                        {
                            .name = "Dysnomia",
                            .mass_kg = 1.5e20,
                            .radius_km = 175,
                            .orbit_radius_km = 37350,
                            .orbital_period_days = 15.774,
                            .eccentricity = 0.013,
                            .facts = {
                                {"Radius", "175 km"},
                                {"Composition", "Ice"},
                                {"Discovery", "2005 (Brown)"},
                                {"Missions", "None"},
                                {"Trivia", "Named after Eris's daughter"},
                            },
                        },
                    },
                },
                {
                    .name = "Haumea",
                    .mass_kg = 4.006e21,
                    .radius_km = 816,
                    .orbit_radius_km = 6452.2e6,
                    .orbital_period_days = 103660,
                    .eccentricity = 0.194,
                    .color = {230, 230, 230},
                    .facts = {
                        {"Radius", "816 km"},
                        {"Composition", "Ice, rock"},
                        {"Discovery", "2004 (Brown)"},
                        {"Missions", "None"},
                        {"Trivia", "Oblate shape due to fast rotation"},
                    },
                    .children = {
                        {
                            .name = "Hi'iaka",
                            .mass_kg = 1.79e19,
                            .radius_km = 160,
                            .orbit_radius_km = 49880,
                            .orbital_period_days = 49.12,
                            .eccentricity = 0.051,
                            .facts = {
                                {"Radius", "160 km"},
                                {"Composition", "Ice"},
                                {"Discovery", "2005 (Brown)"},
                                {"Missions", "None"},
                                {"Trivia", "Named after Hawaiian goddess"},
                            },
                        },
                        {
                            .name = "Namaka",
                            .mass_kg = 1.79e18,
                            .radius_km = 85,
                            .orbit_radius_km = 25657,
                            .orbital_period_days = 18.28,
                            .eccentricity = 0.103,
                            .facts = {
                                {"Radius", "85 km"},
                                {"Composition", "Ice"},
                                {"Discovery", "2005 (Brown)"},
                                {"Missions", "None"},
                                {"Trivia", "Named after Hawaiian sea goddess"},
                            },
                        },
                    },
                },
                {
                    .name = "Makemake",
                    .mass_kg = 3.1e21,
                    .radius_km = 715,
                    .orbit_radius_km = 6834.7e6,
                    .orbital_period_days = 111690,
                    .eccentricity = 0.159,
                    .color = {200, 120, 120},
                    .facts = {
                        {"Radius", "715 km"},
                        {"Composition", "Ice (methane, ethane), rock"},
                        {"Discovery", "2005 (Brown)"},
                        {"Missions", "None"},
                        {"Trivia", "Named after Rapa Nui creator god"},
                    },
                },
                {
                    .name = "Quaoar",
                    .mass_kg = 1.4e21,
                    .radius_km = 555,
                    .orbit_radius_km = 6534.1e6,
                    .orbital_period_days = 105120,
                    .eccentricity = 0.038,
                    .color = {150, 150, 150},
                    .facts = {
                        {"Radius", "555 km"},
                        {"Composition", "Ice, rock"},
                        {"Discovery", "2002 (Brown, Trujillo)"},
                        {"Missions", "None"},
                        {"Trivia", "Named after Tongva creator god"},
                    },
                    .children = {
                        {
                            .name = "Weywot",
                            .mass_kg = 1.4e18,
                            .radius_km = 85,
                            .orbit_radius_km = 14500,
                            .orbital_period_days = 12.438,
                            .eccentricity = 0.14,
                            .facts = {
                                {"Radius", "85 km"},
                                {"Composition", "Ice"},
                                {"Discovery", "2007 (Brown)"},
                                {"Missions", "None"},
                                {"Trivia", "Named after Tongva sky god's son"},
                            },
                        },
                    },
                },
                {
                    .name = "Orcus",
                    .mass_kg = 6.41e20,
                    .radius_km = 458,
                    .orbit_radius_km = 5894.8e6,
                    .orbital_period_days = 89425,
                    .eccentricity = 0.226,
                    .color = {160, 160, 160},
                    .facts = {
                        {"Radius", "458 km"},
                        {"Composition", "Ice, rock"},
                        {"Discovery", "2004 (Brown, Trujillo, Rabinowitz)"},
                        {"Missions", "None"},
                        {"Trivia", "Anti-Pluto, orbits opposite Pluto"},
                    },
                    .children = {
                        {
                            .name = "Vanth",
                            .mass_kg = 9.0e19,
                            .radius_km = 221,
                            .orbit_radius_km = 9000,
                            .orbital_period_days = 9.54,
                            .eccentricity = 0.007,
                            .facts = {
                                {"Radius", "221 km"},
                                {"Composition", "Ice"},
                                {"Discovery", "2007 (Brown)"},
                                {"Missions", "None"},
                                {"Trivia", "Named after Etruscan deity"},
                            },
                        },
                    },
                },
                {
                    .name = "Ceres",
                    .mass_kg = 9.38e20,
                    .radius_km = 473,
                    .orbit_radius_km = 414.0e6,
                    .orbital_period_days = 1680,
                    .eccentricity = 0.075,
                    .color = {170, 170, 170},
                    .facts = {
                        {"Radius", "473 km"},
                        {"Composition", "Rock, ice"},
                        {"Discovery", "1801 (Giuseppe Piazzi)"},
                        {"Missions", "Dawn (2015-2018)"},
                        {"Trivia", "Largest asteroid, only dwarf planet in asteroid belt"},
                    },
                },
                {
                    .name = "Gonggong",
                    .mass_kg = 1.75e21,
                    .radius_km = 615,
                    .orbit_radius_km = 10092.3e6,
                    .orbital_period_days = 202210,
                    .eccentricity = 0.503,
                    .color = {190, 100, 100},
                    .facts = {
                        {"Radius", "615 km"},
                        {"Composition", "Ice, rock"},
                        {"Discovery", "2007 (Schwamb, Brown, Rabinowitz)"},
                        {"Missions", "None"},
                        {"Trivia", "Highly eccentric orbit"},
                    },
                    .children = {
                        {
                            .name = "Xiangliu",
                            .mass_kg = 1.0e19,
                            .radius_km = 100,
                            .orbit_radius_km = 24000,
                            .orbital_period_days = 25.2,
                            .eccentricity = 0.29,
                            .facts = {
                                {"Radius", "100 km"},
                                {"Composition", "Ice"},
                                {"Discovery", "2010 (Schwamb)"},
                                {"Missions", "None"},
                                {"Trivia", "Named after Chinese serpent deity"},
                            },
                        },
                    },
                },
                {
                    .name = "Sedna",
                    .mass_kg = 1.0e21,
                    .radius_km = 498,
                    .orbit_radius_km = 75679.2e6,
                    .orbital_period_days = 4161000,
                    .eccentricity = 0.855,
                    .color = {200, 80, 80},
                    .facts = {
                        {"Radius", "498 km"},
                        {"Composition", "Ice, rock"},
                        {"Discovery", "2003 (Brown, Trujillo, Rabinowitz)"},
                        {"Missions", "None"},
                        {"Trivia", "Most distant known orbit (~76-936 AU)"},
                    },
                },
                {
                    .name = "Salacia",
                    .mass_kg = 4.38e20,
                    .radius_km = 423,
                    .orbit_radius_km = 6314.8e6,
                    .orbital_period_days = 100010,
                    .eccentricity = 0.106,
                    .color = {140, 140, 140},
                    .facts = {
                        {"Radius", "423 km"},
                        {"Composition", "Ice, rock"},
                        {"Discovery", "2004 (Noll, Stephens, Grundy)"},
                        {"Missions", "None"},
                        {"Trivia", "Named after Roman sea goddess"},
                    },
                    .children = {
                        {
                            .name = "Actaea",
                            .mass_kg = 1.2e19,
                            .radius_km = 150,
                            .orbit_radius_km = 5700,
                            .orbital_period_days = 5.493,
                            .eccentricity = 0.008,
                            .facts = {
                                {"Radius", "150 km"},
                                {"Composition", "Ice"},
                                {"Discovery", "2006 (Noll)"},
                                {"Missions", "None"},
                                {"Trivia", "Named after sea nymph"},
                            },
                        },
                    },
                },
            },
        };
    }
} // anonymous namespace

const BodyRecord& solar_system()
{
    static const BodyRecord root = build_solar_system();
    return root;
}

} // namespace orrery::catalog
